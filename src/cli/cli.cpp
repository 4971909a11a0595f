#include "cli/cli.hpp"
#include "cid/cid.hpp"
#include "dag/dag.hpp"
#include "encoding/hex.hpp"
#include "ipc/storage_commitment.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace dcs {
namespace cli {

namespace {

Bytes read_file(const std::string& filename) {
  std::ifstream file(filename, std::ios::binary);
  if (!file) {
    throw std::runtime_error("cannot open " + filename);
  }
  return Bytes(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(const config::Config& config, std::istream& in, std::ostream& out)
  : running_(false)
  , in_(in)
  , out_(out)
  , builder_(config) {
  BOOST_LOG_TRIVIAL(info) << "CLI: Initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "CLI: Starting loop";
  out_ << "DCS_Shell> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    running_ = execute(line);
    if (running_) {
      out_ << "DCS_Shell> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI: Loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command;
  iss >> command;

  if (command.empty()) {
    return true;
  }
  if (command == "quit") {
    return false;
  }

  std::vector<std::string> args;
  for (std::string arg; iss >> arg;) {
    args.push_back(arg);
  }
  process_command(command, args);
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing command: " << command << " with " << args.size() << " arguments";

  if (command == "cid" && args.size() == 1) {
    handle_cid_command(args[0]);
  }
  else if (command == "verify" && args.size() == 2) {
    handle_verify_command(args[0], args[1]);
  }
  else if (command == "dag" && args.size() == 1) {
    handle_dag_command(args[0]);
  }
  else if (command == "bucket-id" && args.size() == 2) {
    handle_bucket_id_command(args[0], args[1]);
  }
  else if (command == "file-id" && args.size() == 2) {
    handle_file_id_command(args[0], args[1]);
  }
  else if (command == "help" && args.empty()) {
    handle_help_command();
  }
  else {
    out_ << "Unknown command or invalid arguments" << std::endl;
  }
}

void CLI::handle_cid_command(const std::string& filename) {
  try {
    out_ << cid::Cid::compute(read_file(filename)) << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error computing CID", e.what());
  }
}

void CLI::handle_verify_command(const std::string& cid, const std::string& filename) {
  try {
    cid::verify_raw(cid, read_file(filename));
    out_ << "OK" << std::endl;
  } catch (const cid::CidMismatch& e) {
    out_ << "MISMATCH " << e.what() << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error verifying CID", e.what());
  }
}

void CLI::handle_dag_command(const std::string& filename) {
  try {
    Bytes data = read_file(filename);
    const size_t step = builder_.read_size();

    dag::DagRoot root;
    for (size_t offset = 0, index = 0; offset < data.size(); offset += step, ++index) {
      Bytes payload(data.begin() + offset, data.begin() + std::min(offset + step, data.size()));
      dag::ChunkDag chunk = builder_.build(payload);
      out_ << "chunk " << index << " " << chunk.cid << " blocks=" << chunk.blocks.size()
           << " size=" << chunk.raw_data_size << " encoded=" << chunk.encoded_size << std::endl;
      root.add_link(chunk.cid, chunk.raw_data_size, chunk.encoded_size);
    }
    out_ << "root " << root.build() << " size=" << root.total_file_size() << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error building DAG", e.what());
  }
}

void CLI::handle_bucket_id_command(const std::string& name, const std::string& address) {
  try {
    out_ << encoding::to_hex(ipc::calculate_bucket_id(name, address)) << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error computing bucket id", e.what());
  }
}

void CLI::handle_file_id_command(const std::string& bucket_id, const std::string& name) {
  try {
    Bytes raw = encoding::from_hex(bucket_id);
    if (raw.size() != Hash32().size()) {
      throw std::invalid_argument("bucket id must be 32 bytes");
    }
    Hash32 id;
    std::copy(raw.begin(), raw.end(), id.begin());
    out_ << encoding::to_hex(ipc::calculate_file_id(id, name)) << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error computing file id", e.what());
  }
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help                        Display this help message" << std::endl;
  out_ << "  cid <file>                  Raw CID of <file>" << std::endl;
  out_ << "  verify <cid> <file>         Check <file> against <cid>" << std::endl;
  out_ << "  dag <file>                  Chunk and root CIDs of <file>" << std::endl;
  out_ << "  bucket-id <name> <address>  Bucket id for <name> owned by <address>" << std::endl;
  out_ << "  file-id <bucket-id> <name>  File id for <name> in <bucket-id>" << std::endl;
  out_ << "  quit                        Exit the DCS shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace dcs
