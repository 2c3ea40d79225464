/**
 * @file sha256.cpp
 * @brief SHA-256 streaming context implementation.
 *
 * @authors hashprim contributors
 */

#include <hashprim/hex.hpp>
#include <hashprim/sha256.hpp>

#include <cstring>

namespace hashprim {

Sha256::Sha256() noexcept
    : state_(INITIAL_HASH), buffer_{}, buffer_len_(0), total_bytes_(0), finalized_(false) {}

void Sha256::reset() noexcept {
    state_ = INITIAL_HASH;
    buffer_.fill(0);
    buffer_len_ = 0;
    total_bytes_ = 0;
    finalized_ = false;
}

Error Sha256::update(const std::uint8_t* data, std::size_t len) noexcept {
    if (finalized_) [[unlikely]] {
        return Error::InvalidState;
    }
    if (len == 0) {
        return Error::Ok;
    }
    if (data == nullptr) [[unlikely]] {
        return Error::InvalidArg;
    }
    auto length_check = check_message_length(total_bytes_, len);
    if (length_check != Error::Ok) [[unlikely]] {
        return length_check;
    }

    total_bytes_ += len;

    // Top up a partially filled block first
    if (buffer_len_ > 0) {
        std::size_t to_copy = BLOCK_BYTES - buffer_len_;
        if (to_copy > len) {
            to_copy = len;
        }
        std::memcpy(buffer_.data() + buffer_len_, data, to_copy);
        buffer_len_ += to_copy;
        data += to_copy;
        len -= to_copy;

        if (buffer_len_ < BLOCK_BYTES) {
            return Error::Ok;
        }
        compress_block(state_, buffer_.data());
        buffer_len_ = 0;
    }

    // Full blocks straight from the input
    while (len >= BLOCK_BYTES) {
        compress_block(state_, data);
        data += BLOCK_BYTES;
        len -= BLOCK_BYTES;
    }

    if (len > 0) {
        std::memcpy(buffer_.data(), data, len);
        buffer_len_ = len;
    }

    return Error::Ok;
}

Error Sha256::finalize(Digest& digest) noexcept {
    if (finalized_) [[unlikely]] {
        return Error::InvalidState;
    }

    const std::uint64_t bit_length = total_bytes_ * 8U;

    // Append the '1' bit; buffer_len_ < BLOCK_BYTES always holds here
    buffer_[buffer_len_++] = 0x80U;

    // No room for the length field: pad out this block and start another
    if (buffer_len_ > PAD_BOUNDARY) {
        std::memset(buffer_.data() + buffer_len_, 0, BLOCK_BYTES - buffer_len_);
        compress_block(state_, buffer_.data());
        buffer_len_ = 0;
    }

    std::memset(buffer_.data() + buffer_len_, 0, PAD_BOUNDARY - buffer_len_);
    for (std::size_t i = 0; i < LENGTH_FIELD_BYTES; ++i) {
        buffer_[PAD_BOUNDARY + i] =
            static_cast<std::uint8_t>((bit_length >> (56U - (i * 8U))) & 0xFFU);
    }
    compress_block(state_, buffer_.data());
    buffer_len_ = 0;

    for (std::size_t i = 0; i < STATE_WORDS; ++i) {
        store_be32(state_[i], &digest[i * 4]);
    }

    finalized_ = true;
    return Error::Ok;
}

Error sha256(const std::uint8_t* data, std::size_t len, Digest& digest) noexcept {
    Sha256 ctx;
    auto result = ctx.update(data, len);
    if (result != Error::Ok) {
        return result;
    }
    return ctx.finalize(digest);
}

#if !HASHPRIM_NO_EXCEPTIONS

std::string sha256_hex(std::string_view message) {
    Digest digest{};
    auto result = sha256(reinterpret_cast<const std::uint8_t*>(message.data()), message.size(),
                         digest);
    throw_if_error(result, "sha256");
    return to_hex(digest.data(), digest.size());
}

#endif // !HASHPRIM_NO_EXCEPTIONS

} // namespace hashprim
