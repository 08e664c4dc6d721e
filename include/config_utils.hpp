#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>

/**
 * @brief Load option values from a YAML file.
 *
 * Top-level keys are option names without the leading dashes. A key whose
 * value is a map is treated as a category section and its entries are
 * merged into the top level, so `logging: {log-level: debug}` yields
 * `--log-level=debug`. Booleans and numbers are stored as their text, a
 * null value as an empty string.
 *
 * @param path  Filesystem path to the YAML configuration file.
 * @param opts  Map receiving values keyed by `--option`.
 * @param error Human-readable message on failure.
 * @return `true` if the configuration was loaded successfully.
 */
bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

/**
 * @brief Load option values from a JSON file.
 *
 * Same layout rules as load_yaml_config(); the root value must be an object.
 */
bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

#endif // CONFIG_UTILS_HPP
