#ifndef IFS_CLI_CLI_HPP
#define IFS_CLI_CLI_HPP

#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "download/download_service.hpp"
#include "store/content_store.hpp"

namespace ifs {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(store::WritableContentStore& store, const download::DownloadService& service,
        std::istream& input = std::cin, std::ostream& output = std::cout);


    // ---- STARTUP ----
    // Reads commands until "quit" or end of input
    void run();
    // Executes a single command line, returns false on "quit"
    bool execute(const std::string& line);

private:
    // ---- PARAMETERS ----
    bool running_;
    // System components
    store::WritableContentStore& store_;
    const download::DownloadService& service_;
    std::istream& input_;
    std::ostream& output_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::vector<std::string>& args);
    void handle_publish_command(const std::vector<std::string>& args);
    void handle_versions_command(const std::vector<std::string>& args);
    void handle_download_command(const std::vector<std::string>& args);
    void handle_fetch_command(const std::vector<std::string>& args);
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);

    // Parses "<component> [version] <outfile>" starting at args[first]
    bool parse_download_target(const std::vector<std::string>& args, std::size_t first,
                               download::DownloadRequest& request, std::string& outfile);
    static std::optional<store::Version> parse_version(const std::string& text);
};

} // namespace cli
} // namespace ifs

#endif // IFS_CLI_CLI_HPP
