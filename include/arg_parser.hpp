#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Small command line parser for long options and positionals.
 *
 * Options are written as `--flag`, `--opt value` or `--opt=value`. Options
 * listed in @a value_flags always consume a value; all other known options
 * are boolean switches, so a positional following a switch is never taken as
 * its value. Short options map to their long form (`-p 2222`, `-p2222`, and
 * stacked switches such as `-nv`). A bare `--` ends option parsing; every
 * later argument is positional.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Options present on the command line
    std::map<std::string, std::string> options_; ///< Values keyed by option
    std::vector<std::string> positional_;        ///< Positional arguments in order
    std::vector<std::string> unknown_flags_;     ///< Options not in known_flags
    std::vector<std::string> missing_values_;    ///< Value options given without a value
    std::set<std::string> known_flags_;
    std::set<std::string> value_flags_;
    std::map<char, std::string> short_map_;

    bool known(const std::string& key) const {
        return known_flags_.empty() || known_flags_.count(key) > 0;
    }

    void store(const std::string& key, const std::string* val) {
        if (!known(key)) {
            unknown_flags_.push_back(key);
            return;
        }
        flags_.insert(key);
        if (val)
            options_[key] = *val;
    }

  public:
    /**
     * @param argc        Argument count from `main`.
     * @param argv        Argument vector from `main`.
     * @param known_flags Accepted options; when empty every option is accepted.
     * @param short_map   Single character aliases such as `{'h', "--help"}`.
     * @param value_flags Options that require a value.
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::map<char, std::string>& short_map = {},
              const std::set<std::string>& value_flags = {})
        : known_flags_(known_flags), value_flags_(value_flags), short_map_(short_map) {
        bool options_done = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (options_done || arg == "-" || arg.empty() || arg[0] != '-') {
                positional_.push_back(arg);
                continue;
            }
            if (arg == "--") {
                options_done = true;
                continue;
            }
            if (arg.rfind("--", 0) == 0) {
                size_t eq = arg.find('=');
                if (eq != std::string::npos) {
                    std::string key = arg.substr(0, eq);
                    std::string val = arg.substr(eq + 1);
                    store(key, &val);
                } else if (value_flags_.count(arg)) {
                    if (i + 1 < argc) {
                        std::string val = argv[++i];
                        store(arg, &val);
                    } else {
                        missing_values_.push_back(arg);
                    }
                } else {
                    store(arg, nullptr);
                }
                continue;
            }
            // short option cluster
            for (size_t j = 1; j < arg.size(); ++j) {
                auto it = short_map_.find(arg[j]);
                if (it == short_map_.end()) {
                    unknown_flags_.push_back(std::string("-") + arg[j]);
                    break;
                }
                const std::string& key = it->second;
                if (!value_flags_.count(key)) {
                    store(key, nullptr);
                    continue;
                }
                std::string val = arg.substr(j + 1);
                if (!val.empty() && val[0] == '=')
                    val.erase(0, 1);
                if (val.empty()) {
                    if (i + 1 < argc) {
                        val = argv[++i];
                    } else {
                        missing_values_.push_back(key);
                        break;
                    }
                }
                store(key, &val);
                break;
            }
        }
    }

    /** @return `true` if @p flag was present. */
    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /** @return Value given for @p opt, or an empty string. */
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        if (it != options_.end())
            return it->second;
        return "";
    }

    const std::set<std::string>& flags() const { return flags_; }
    const std::map<std::string, std::string>& options() const { return options_; }
    const std::vector<std::string>& positional() const { return positional_; }
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }
    const std::vector<std::string>& missing_values() const { return missing_values_; }
};

#endif // ARG_PARSER_HPP
