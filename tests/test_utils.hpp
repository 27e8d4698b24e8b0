#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <tuple>
#include <vector>
#include "crypto.hpp"
#include "download.hpp"
#include "errors.hpp"
#include "host_session.hpp"

namespace test_utils {

using namespace sectorcast;

// Scratch directory removed with everything in it on destruction.
class TempDir {
public:
    TempDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "sectorcast-XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (mkdtemp(buf.data()))
            path_ = buf.data();
    }
    ~TempDir() {
        std::error_code ec;
        if (!path_.empty())
            std::filesystem::remove_all(path_, ec);
    }
    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const { return path_ + "/" + name; }
private:
    std::string path_;
};

inline std::vector<uint8_t> pattern_bytes(size_t n, uint32_t seed) {
    std::vector<uint8_t> out(n);
    uint32_t x = seed ? seed : 1;
    for (size_t i = 0; i < n; i++) {
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        out[i] = (uint8_t)x;
    }
    return out;
}

inline bool write_file(const std::string& path, const std::vector<uint8_t>& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write((const char*)data.data(), (std::streamsize)data.size());
    return (bool)out;
}

inline bool eventually(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

// What a fake host received, kept outside the session so tests can inspect
// it after the session is handed to a worker.
struct HostStore {
    using Key = std::tuple<uint64_t, uint64_t, uint16_t>;

    std::mutex mtx;
    std::map<Key, std::vector<uint8_t>> sectors;
    std::atomic<int> attempts{0};
    std::atomic<int> fail_next{0};
    std::atomic<bool> always_fail{false};
    std::atomic<bool> block{false};
    std::atomic<bool> good{true};

    size_t size() {
        std::lock_guard<std::mutex> lk(mtx);
        return sectors.size();
    }
    size_t segment_sectors(uint64_t segment_index) {
        std::lock_guard<std::mutex> lk(mtx);
        size_t n = 0;
        for (auto& kv : sectors)
            n += std::get<1>(kv.first) == segment_index ? 1 : 0;
        return n;
    }
};

class FakeHostSession : public HostSession {
public:
    FakeHostSession(std::string id, std::shared_ptr<HostStore> store)
        : id_(std::move(id)), store_(std::move(store)) {}

    const std::string& host_id() const override { return id_; }
    bool good_for_upload() const override { return store_->good; }

    std::error_code upload_sector(uint64_t file_id, uint64_t segment_index,
                                  uint16_t sector_index,
                                  const std::vector<uint8_t>& data,
                                  TaskManager& tm) override {
        store_->attempts++;
        if (store_->block) {
            while (!tm.wait_for_stop(std::chrono::milliseconds(10))) {
            }
            return errc::interrupted;
        }
        if (store_->always_fail)
            return errc::upload_rejected;
        int left = store_->fail_next.load();
        while (left > 0) {
            if (store_->fail_next.compare_exchange_weak(left, left - 1))
                return errc::connection_failed;
        }
        std::lock_guard<std::mutex> lk(store_->mtx);
        store_->sectors[HostStore::Key(file_id, segment_index, sector_index)] = data;
        return {};
    }

private:
    std::string id_;
    std::shared_ptr<HostStore> store_;
};

// Serves downloads from an in-memory copy of the file.
class FakeDownloader : public Downloader {
public:
    explicit FakeDownloader(std::vector<uint8_t> content) : content_(std::move(content)) {}

    std::shared_ptr<Download> new_download(const DownloadParams& params,
                                           std::error_code& ec) override {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            calls_.push_back(params);
        }
        if (fail_) {
            ec = errc::download_failed;
            return nullptr;
        }
        auto d = std::make_shared<Download>(params.destination);
        uint64_t end = std::min<uint64_t>(params.offset + params.length, content_.size());
        if (params.offset < end)
            params.destination->write_at(0, content_.data() + params.offset,
                                         (size_t)(end - params.offset));
        d->complete(std::error_code());
        return d;
    }

    std::vector<DownloadParams> calls() {
        std::lock_guard<std::mutex> lk(mtx_);
        return calls_;
    }
    void set_fail(bool f) { fail_ = f; }

private:
    std::vector<uint8_t> content_;
    std::mutex mtx_;
    std::vector<DownloadParams> calls_;
    std::atomic<bool> fail_{false};
};

// Fails the first fail_first encryptions (all of them if negative). A
// successful encryption appends a marker so tests can tell what was sent.
class FlakyCipher : public CryptoProvider {
public:
    static constexpr uint8_t kMarker[4] = {'E', 'N', 'C', '!'};

    explicit FlakyCipher(int fail_first) : fail_left_(fail_first) {}

    void set_key(const std::vector<uint8_t>&) override {}
    bool encrypt(uint64_t, uint64_t, uint16_t, std::vector<uint8_t>& inout) override {
        calls_++;
        if (fail_left_ < 0)
            return false;
        int left = fail_left_.load();
        while (left > 0) {
            if (fail_left_.compare_exchange_weak(left, left - 1))
                return false;
        }
        inout.insert(inout.end(), kMarker, kMarker + 4);
        return true;
    }
    bool decrypt(uint64_t, uint64_t, uint16_t, std::vector<uint8_t>& inout) override {
        if (inout.size() < 4)
            return false;
        inout.resize(inout.size() - 4);
        return true;
    }
    int calls() const { return calls_; }

    static bool marked(const std::vector<uint8_t>& data) {
        return data.size() >= 4 && std::equal(kMarker, kMarker + 4, data.end() - 4);
    }

private:
    std::atomic<int> fail_left_;
    std::atomic<int> calls_{0};
};

} // namespace test_utils
