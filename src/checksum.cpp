// Copyright 2025 Siddhant Biradar
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "depmap/checksum.hpp"
#include "depmap/errors.hpp"
#include <iomanip>
#include <memory>
#include <openssl/evp.h>
#include <sstream>

namespace depmap {

std::string sha256_hex(std::string_view data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                                &EVP_MD_CTX_free);
    if (!ctx) {
        throw Error("Failed to create EVP_MD_CTX");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        throw Error("SHA-256 digest failed");
    }

    std::ostringstream ss;
    for (unsigned int i = 0; i < hash_len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

void ChecksumIndex::begin_walk() {
    seen_.clear();
    previous_.clear();
}

ChangeKind ChecksumIndex::record(const std::string &path, const std::string &digest) {
    seen_.insert(path);

    auto it = digests_.find(path);
    if (it == digests_.end()) {
        previous_.emplace(path, std::nullopt);
        digests_.emplace(path, digest);
        return ChangeKind::Added;
    }
    if (it->second == digest) {
        return ChangeKind::Unchanged;
    }

    previous_.emplace(path, it->second);
    it->second = digest;
    return ChangeKind::Modified;
}

void ChecksumIndex::record_unreadable(const std::string &path) { seen_.insert(path); }

std::vector<std::string> ChecksumIndex::finish_walk() const {
    std::vector<std::string> removed;
    for (const auto &[path, digest] : digests_) {
        if (seen_.find(path) == seen_.end()) {
            removed.push_back(path);
        }
    }
    return removed;
}

void ChecksumIndex::confirm_removed(const std::string &path) {
    digests_.erase(path);
    previous_.erase(path);
}

void ChecksumIndex::revert(const std::string &path) {
    auto it = previous_.find(path);
    if (it == previous_.end())
        return;

    if (it->second) {
        digests_[path] = *it->second;
    } else {
        digests_.erase(path);
    }
    previous_.erase(it);
}

std::optional<std::string> ChecksumIndex::digest_of(const std::string &path) const {
    auto it = digests_.find(path);
    if (it == digests_.end())
        return std::nullopt;
    return it->second;
}

json ChecksumIndex::to_json() const {
    json j = json::object();
    for (const auto &[path, digest] : digests_) {
        j[path] = digest;
    }
    return j;
}

ChecksumIndex ChecksumIndex::from_json(const json &j) {
    ChecksumIndex index;
    if (!j.is_object()) {
        throw StoreError("checksum index must be a JSON object");
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        index.digests_[it.key()] = it.value().get<std::string>();
    }
    return index;
}

} // namespace depmap
