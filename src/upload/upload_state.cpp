#include "upload/upload_state.hpp"
#include <boost/log/trivial.hpp>

namespace dcs::upload {

//==============================================
// CHUNK LIFECYCLE
//==============================================

void UploadState::pre_create_chunk(uint64_t index, const dag::ChunkDag& chunk, const std::string& tx_hash) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (committed_) {
        BOOST_LOG_TRIVIAL(error) << "Upload state: Chunk " << index << " arrived after the root was sealed";
        throw StateSealed("cannot add chunk " + std::to_string(index));
    }

    dag::ChunkLink link{chunk.cid, chunk.raw_data_size, chunk.encoded_size};
    pending_.insert_or_assign(index, PendingChunk{index, link, chunk.blocks.size(), tx_hash});

    auto [it, inserted] = links_.try_emplace(index, link);
    if (inserted) {
        ++chunk_count_;
    } else {
        BOOST_LOG_TRIVIAL(warning) << "Upload state: Chunk " << index << " resubmitted, replacing " << it->second.cid;
        raw_size_ -= it->second.raw_data_size;
        encoded_size_ -= it->second.encoded_size;
        it->second = link;
    }
    raw_size_ += chunk.raw_data_size;
    encoded_size_ += chunk.encoded_size;

    BOOST_LOG_TRIVIAL(debug) << "Upload state: Chunk " << index << " pending in tx " << tx_hash
                             << " (" << pending_.size() << " pending)";
}

bool UploadState::chunk_confirmed(uint64_t index) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (pending_.erase(index) == 0) {
        BOOST_LOG_TRIVIAL(trace) << "Upload state: Chunk " << index << " already confirmed";
        return false;
    }

    BOOST_LOG_TRIVIAL(debug) << "Upload state: Chunk " << index << " confirmed (" << pending_.size()
                             << " pending)";
    return true;
}

std::vector<PendingChunk> UploadState::list_pending_chunks() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<PendingChunk> snapshot;
    snapshot.reserve(pending_.size());
    for (const auto& entry : pending_) {
        snapshot.push_back(entry.second);
    }
    return snapshot;
}

//==============================================
// ROOT
//==============================================

cid::Cid UploadState::seal() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (root_) {
        return *root_;
    }

    if (!pending_.empty()) {
        BOOST_LOG_TRIVIAL(error) << "Upload state: Cannot seal with " << pending_.size() << " unconfirmed chunks";
        throw ChunksPending(std::to_string(pending_.size()) + " chunks await confirmation");
    }

    // links_ is keyed by chunk index, so iteration is already in file order
    dag::DagRoot root;
    for (const auto& entry : links_) {
        root.add_link(entry.second.cid, entry.second.raw_data_size, entry.second.encoded_size);
    }

    root_ = root.build();
    committed_ = true;

    BOOST_LOG_TRIVIAL(info) << "Upload state: Sealed root " << *root_ << " over " << links_.size() << " chunks";
    return *root_;
}

std::optional<cid::Cid> UploadState::root_cid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return root_;
}

bool UploadState::committed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return committed_;
}

//==============================================
// TOTALS
//==============================================

uint64_t UploadState::chunk_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunk_count_;
}

uint64_t UploadState::raw_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return raw_size_;
}

uint64_t UploadState::encoded_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return encoded_size_;
}

size_t UploadState::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

} // namespace dcs::upload
