#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "config/config.hpp"
#include "upload/chunk_builder.hpp"

namespace dcs {
namespace cli {

// Offline inspection shell: CIDs, chunk DAGs and on-chain identifiers
class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    explicit CLI(const config::Config& config, std::istream& in = std::cin, std::ostream& out = std::cout);


    // ---- STARTUP ----
    void run();

    // Runs a single command line; returns false for "quit"
    bool execute(const std::string& line);

private:
    // ---- PARAMETERS ----
    bool running_;
    std::istream& in_;
    std::ostream& out_;
    upload::ChunkBuilder builder_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::vector<std::string>& args);
    void handle_cid_command(const std::string& filename);
    void handle_verify_command(const std::string& cid, const std::string& filename);
    void handle_dag_command(const std::string& filename);
    void handle_bucket_id_command(const std::string& name, const std::string& address);
    void handle_file_id_command(const std::string& bucket_id, const std::string& name);
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace dcs
