#include "upload/uploader.hpp"
#include "ipc/contract_errors.hpp"
#include "ipc/storage_commitment.hpp"
#include "ipc/transaction.hpp"
#include <algorithm>
#include <condition_variable>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/log/trivial.hpp>

namespace dcs::upload {

namespace {

config::Config validated(config::Config config) {
    config.validate();
    if (config.private_key.empty()) {
        throw config::ConfigError("private_key is required for uploads");
    }
    if (config.storage_contract_address.empty()) {
        throw config::ConfigError("storage_contract_address is required for uploads");
    }
    return config;
}

Hash32 to_hash32(const Bytes& digest) {
    Hash32 out{};
    std::copy_n(digest.begin(), std::min(digest.size(), out.size()), out.begin());
    return out;
}

uint64_t deadline_after(std::chrono::seconds validity) {
    auto now = std::chrono::system_clock::now() + validity;
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count());
}

// Limits the number of chunks buffered for the pool
class InFlightLimit {
public:
    explicit InFlightLimit(size_t limit) : limit_(limit) {}

    void acquire() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return in_flight_ < limit_; });
        ++in_flight_;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --in_flight_;
        }
        cv_.notify_one();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    size_t limit_;
    size_t in_flight_ = 0;
};

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

Uploader::Uploader(config::Config config, ipc::ChainClient& chain, ipc::StorageNodeClient& node)
    : config_(validated(std::move(config))),
      chain_(chain),
      node_(node),
      key_(crypto::PrivateKey::from_hex(config_.private_key)),
      owner_(key_.address()),
      storage_address_(ipc::parse_address(config_.storage_contract_address)),
      builder_(config_),
      retry_(config_.retry_max_attempts, config_.retry_base_delay) {
    BOOST_LOG_TRIVIAL(info) << "Uploader: Ready for " << crypto::to_checksum_address(owner_)
                            << " (chunk " << builder_.read_size() << " bytes, concurrency "
                            << config_.max_concurrency << (builder_.encrypted() ? ", encrypted" : "")
                            << (builder_.erasure_coded() ? ", erasure coded" : "") << ")";
}

//==============================================
// CHUNK PIPELINE
//==============================================

std::string Uploader::submit_with_retry(const std::function<std::string()>& submit,
                                        const retry::CancellationToken& cancel) {
    std::string tx_hash;
    std::exception_ptr error = retry_.run([&]() {
        try {
            tx_hash = submit();
            return retry::Attempt::success();
        } catch (const std::exception& e) {
            bool retryable = ipc::is_retryable_tx_error(e.what());
            return retry::Attempt{retryable, ipc::error_from_selector(std::current_exception())};
        }
    }, cancel);

    if (error) {
        std::rethrow_exception(error);
    }
    return tx_hash;
}

void Uploader::upload_blocks(uint64_t index, const dag::ChunkDag& chunk, const Hash32& bucket_id,
                             const retry::CancellationToken& cancel) {
    const Bytes chunk_cid = chunk.cid.bytes();
    const Hash32 node_id = node_.node_id();
    const uint64_t deadline = deadline_after(config_.commitment_validity);

    for (size_t i = 0; i < chunk.blocks.size(); ++i) {
        const dag::Block& block = chunk.blocks[i];

        ipc::SignedCommitment commitment;
        commitment.data.chunk_cid = chunk_cid;
        commitment.data.block_cid = to_hash32(block.cid.hash().digest);
        commitment.data.chunk_index = index;
        commitment.data.block_index = static_cast<uint8_t>(i);
        commitment.data.node_id = node_id;
        commitment.data.nonce = ipc::generate_nonce();
        commitment.data.deadline = deadline;
        commitment.data.bucket_id = bucket_id;
        commitment.signature = ipc::sign_block(key_, storage_address_, config_.chain_id, commitment.data);

        const Bytes block_cid = block.cid.bytes();
        std::exception_ptr error = retry_.run([&]() {
            try {
                node_.upload_block(block_cid, block.data, commitment);
                return retry::Attempt::success();
            } catch (const std::exception&) {
                return retry::Attempt::retryable(std::current_exception());
            }
        }, cancel);

        if (error) {
            BOOST_LOG_TRIVIAL(error) << "Uploader: Block " << i << " of chunk " << index << " failed: "
                                     << retry::describe(error);
            std::rethrow_exception(error);
        }
        BOOST_LOG_TRIVIAL(trace) << "Uploader: Uploaded block " << i << " of chunk " << index;
    }
}

void Uploader::process_chunk(uint64_t index, const Bytes& payload, const Hash32& bucket_id,
                             const std::string& file_name, UploadState& state,
                             const retry::CancellationToken& cancel) {
    dag::ChunkDag chunk = builder_.build(payload);
    BOOST_LOG_TRIVIAL(debug) << "Uploader: Chunk " << index << " is " << chunk.cid << " with "
                             << chunk.blocks.size() << " blocks";

    upload_blocks(index, chunk, bucket_id, cancel);

    ipc::ChunkSubmission submission;
    submission.bucket_id = bucket_id;
    submission.file_name = file_name;
    submission.chunk_index = index;
    submission.chunk_cid = chunk.cid.bytes();
    submission.raw_size = chunk.raw_data_size;
    submission.encoded_size = chunk.encoded_size;
    for (const auto& block : chunk.blocks) {
        submission.block_cids.push_back(to_hash32(block.cid.hash().digest));
        submission.block_sizes.push_back(block.data.size());
    }

    std::string tx_hash = submit_with_retry([&]() { return chain_.add_file_chunk(submission); }, cancel);
    state.pre_create_chunk(index, chunk, tx_hash);

    ipc::wait_for_transaction(chain_, tx_hash, config_.tx_poll_interval, config_.tx_timeout, &cancel);
    state.chunk_confirmed(index);
}

//==============================================
// UPLOAD
//==============================================

void Uploader::cancel() {
    std::lock_guard<std::mutex> lock(cancel_mutex_);
    if (active_cancel_) {
        BOOST_LOG_TRIVIAL(info) << "Uploader: Cancelling upload";
        active_cancel_->cancel();
    }
}

FileMeta Uploader::upload(const std::string& bucket_name, const std::string& file_name, std::istream& input) {
    if (bucket_name.size() < config::MIN_BUCKET_NAME_LENGTH) {
        throw UploadError("bucket name must be at least " + std::to_string(config::MIN_BUCKET_NAME_LENGTH) +
                          " characters");
    }
    if (file_name.empty()) {
        throw UploadError("file name is required");
    }

    auto read_chunk = [&]() {
        Bytes payload(builder_.read_size());
        input.read(reinterpret_cast<char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
        payload.resize(static_cast<size_t>(input.gcount()));
        return payload;
    };

    Bytes payload = read_chunk();
    if (payload.size() < config::MIN_FILE_SIZE && !input) {
        BOOST_LOG_TRIVIAL(error) << "Uploader: " << file_name << " has only " << payload.size() << " bytes";
        throw FileTooSmall(std::to_string(payload.size()) + " bytes, minimum is " +
                           std::to_string(config::MIN_FILE_SIZE));
    }

    const Hash32 bucket_id = ipc::calculate_bucket_id(bucket_name, owner_);
    BOOST_LOG_TRIVIAL(info) << "Uploader: Uploading " << file_name << " to bucket " << bucket_name;

    retry::CancellationToken cancel;
    {
        std::lock_guard<std::mutex> lock(cancel_mutex_);
        active_cancel_ = &cancel;
    }

    UploadState state;
    std::mutex error_mutex;
    std::exception_ptr first_error;
    InFlightLimit limit(config_.max_concurrency);
    uint64_t chunk_index = 0;

    {
        boost::asio::thread_pool pool(config_.max_concurrency);

        while (!payload.empty() && !cancel.cancelled()) {
            limit.acquire();
            const uint64_t index = chunk_index++;
            boost::asio::post(pool, [&, index, chunk_payload = std::move(payload)]() {
                if (!cancel.cancelled()) {
                    try {
                        process_chunk(index, chunk_payload, bucket_id, file_name, state, cancel);
                    } catch (const std::exception& e) {
                        BOOST_LOG_TRIVIAL(error) << "Uploader: Chunk " << index << " failed: " << e.what();
                        std::lock_guard<std::mutex> lock(error_mutex);
                        if (!first_error) {
                            first_error = std::current_exception();
                        }
                        cancel.cancel();
                    }
                }
                limit.release();
            });

            payload = input ? read_chunk() : Bytes();
        }

        pool.join();
    }

    {
        std::lock_guard<std::mutex> lock(cancel_mutex_);
        active_cancel_ = nullptr;
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
    if (cancel.cancelled()) {
        throw retry::RetryAborted("upload of " + file_name + " cancelled");
    }

    cid::Cid root = state.seal();
    const Bytes root_bytes = root.bytes();
    std::string commit_tx = submit_with_retry([&]() {
        return chain_.commit_file(bucket_id, file_name, state.encoded_size(), state.raw_size(), root_bytes);
    }, cancel);
    ipc::wait_for_transaction(chain_, commit_tx, config_.tx_poll_interval, config_.tx_timeout, &cancel);

    FileMeta meta{root, bucket_id, file_name, state.raw_size(), state.encoded_size(), state.chunk_count(), commit_tx};
    BOOST_LOG_TRIVIAL(info) << "Uploader: Committed " << file_name << " as " << meta.root_cid << " ("
                            << meta.raw_size << " bytes in " << meta.chunk_count << " chunks)";
    return meta;
}

} // namespace dcs::upload
