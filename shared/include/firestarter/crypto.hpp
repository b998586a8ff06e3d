/**
 * Firestarter - Content hashing built on libsodium (BLAKE2b, 32-byte digest, hex encoded).
 */
#pragma once

#include <cstddef>
#include <span>
#include <string>

#include <sodium.h>

namespace firestarter::crypto
{

    // Incremental hasher fed one chunk at a time. finalize() may be called once.
    class StreamHasher
    {
    public:
        StreamHasher();

        void update(std::span<const std::byte> data);
        std::string finalize();

        bool finalized() const noexcept { return finalized_; }

    private:
        crypto_generichash_state state_{};
        bool finalized_{false};
    };

} // namespace firestarter::crypto
