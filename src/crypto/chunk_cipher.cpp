#include "peerdrop/crypto/chunk_cipher.hpp"
#include "peerdrop/crypto/aes_gcm.hpp"
#include "peerdrop/crypto/sodium_interop.hpp"
#include "peerdrop/core/format.hpp"

#include <algorithm>

namespace peerdrop::crypto {

namespace {

using BytesResult = Result<std::vector<uint8_t>, PeerDropFailure>;

NonceSalt RandomSalt() {
    NonceSalt salt{};
    SodiumInterop::FillRandom(salt);
    return salt;
}

BytesResult EncryptWithKey(const TransferKey& key,
                           std::span<const uint8_t> nonce,
                           std::span<const uint8_t> plaintext) {
    auto sealed = key.WithKeyBytes([&](std::span<const uint8_t> key_bytes) {
        return AesGcm::Encrypt(key_bytes, nonce, plaintext);
    });
    if (sealed.IsErr()) {
        return BytesResult::Err(std::move(sealed).UnwrapErr());
    }
    return std::move(sealed).Unwrap();
}

BytesResult DecryptWithKey(const TransferKey& key,
                           std::span<const uint8_t> nonce,
                           std::span<const uint8_t> ciphertext) {
    auto opened = key.WithKeyBytes([&](std::span<const uint8_t> key_bytes) {
        return AesGcm::Decrypt(key_bytes, nonce, ciphertext);
    });
    if (opened.IsErr()) {
        return BytesResult::Err(std::move(opened).UnwrapErr());
    }
    return std::move(opened).Unwrap();
}

} // namespace

ChunkNonce CreateChunkNonce(const uint64_t index, const NonceSalt& salt) {
    ChunkNonce nonce{};
    for (size_t i = 0; i < kChunkIndexBytes; ++i) {
        nonce[i] = static_cast<uint8_t>(index >> (8 * (kChunkIndexBytes - 1 - i)));
    }
    std::copy(salt.begin(), salt.end(), nonce.begin() + kChunkIndexBytes);
    return nonce;
}

uint64_t ChunkIndexFromNonce(std::span<const uint8_t> nonce) {
    uint64_t index = 0;
    for (size_t i = 0; i < kChunkIndexBytes && i < nonce.size(); ++i) {
        index = (index << 8) | nonce[i];
    }
    return index;
}

ChunkSealer::ChunkSealer(const TransferKey& key)
    : ChunkSealer(key, RandomSalt()) {}

ChunkSealer::ChunkSealer(const TransferKey& key, const NonceSalt& salt)
    : key_(key)
    , salt_(salt) {}

Result<SealedChunk, PeerDropFailure> ChunkSealer::Seal(
    const uint64_t index, std::span<const uint8_t> plaintext) {
    if (last_index_.has_value() && index <= *last_index_) {
        return Result<SealedChunk, PeerDropFailure>::Err(
            PeerDropFailure::Encryption(
                compat::format("Refusing to reuse nonce: chunk {} after chunk {}",
                    index, *last_index_)));
    }

    const ChunkNonce nonce = CreateChunkNonce(index, salt_);
    auto ciphertext = EncryptWithKey(key_, nonce, plaintext);
    if (ciphertext.IsErr()) {
        return Result<SealedChunk, PeerDropFailure>::Err(std::move(ciphertext).UnwrapErr());
    }
    last_index_ = index;
    return Result<SealedChunk, PeerDropFailure>::Ok(
        SealedChunk{index, nonce, std::move(ciphertext).Unwrap()});
}

Result<std::vector<uint8_t>, PeerDropFailure> OpenChunk(
    const TransferKey& key,
    const uint64_t index,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext) {
    if (nonce.size() != kAesGcmNonceBytes) {
        return BytesResult::Err(PeerDropFailure::Encryption(
            compat::format("Chunk nonce must be {} bytes, got {}",
                kAesGcmNonceBytes, nonce.size())));
    }
    if (ChunkIndexFromNonce(nonce) != index) {
        return BytesResult::Err(PeerDropFailure::Encryption(
            compat::format("Nonce of chunk {} carries index {}",
                index, ChunkIndexFromNonce(nonce))));
    }
    auto plaintext = DecryptWithKey(key, nonce, ciphertext);
    if (plaintext.IsErr()) {
        return BytesResult::Err(PeerDropFailure::Encryption(
            compat::format("Chunk {}: {}", index, plaintext.UnwrapErr().message)));
    }
    return plaintext;
}

Result<SealedMetadata, PeerDropFailure> SealMetadata(
    const TransferKey& key, std::span<const uint8_t> plaintext) {
    ChunkNonce nonce{};
    SodiumInterop::FillRandom(nonce);
    auto ciphertext = EncryptWithKey(key, nonce, plaintext);
    if (ciphertext.IsErr()) {
        return Result<SealedMetadata, PeerDropFailure>::Err(std::move(ciphertext).UnwrapErr());
    }
    return Result<SealedMetadata, PeerDropFailure>::Ok(
        SealedMetadata{nonce, std::move(ciphertext).Unwrap()});
}

Result<std::vector<uint8_t>, PeerDropFailure> OpenMetadata(
    const TransferKey& key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext) {
    if (nonce.size() != kAesGcmNonceBytes) {
        return BytesResult::Err(PeerDropFailure::Encryption(
            compat::format("Metadata nonce must be {} bytes, got {}",
                kAesGcmNonceBytes, nonce.size())));
    }
    return DecryptWithKey(key, nonce, ciphertext);
}

} // namespace peerdrop::crypto
