/**
 * @file remotesync.cpp
 * @brief CLI entry point for the single-instance remote sync guard.
 *
 * Fetches a remote directory through sftp (purging the source afterwards) or
 * moves it with rsync, while a lock file keeps concurrent runs out.
 */

#include <iostream>

#include "cli_commands.hpp"

/**
 * @brief Application entry point.
 *
 * @return Zero on success or when printing help/version; the run's exit
 *         code on failure; 1 on unexpected errors.
 */
#ifndef REMOTESYNC_NO_MAIN
int main(int argc, char* argv[]) {
    try {
        return cli::run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
}
#endif // REMOTESYNC_NO_MAIN
