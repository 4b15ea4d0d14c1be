#pragma once
#include <sodium.h>
#include <stdexcept>
#include <cstddef>
#include <cstring>
#include <string>

// Guarded, locked, zero-on-free storage for keys and decrypted plaintext.
// sodium_init() must have succeeded before the first allocation.
class SecureBuffer {
public:
    explicit SecureBuffer(size_t size)
        : size_(size)
    {
        if (size_ == 0) {
            return;
        }

        ptr_ = static_cast<unsigned char*>(sodium_malloc(size_));
        if (!ptr_) {
            throw std::runtime_error("SecureBuffer: sodium_malloc failed");
        }

        if (sodium_mlock(ptr_, size_) != 0) {
            sodium_free(ptr_);
            throw std::runtime_error("SecureBuffer: sodium_mlock failed");
        }

        sodium_memzero(ptr_, size_);
    }

    SecureBuffer(const void* src, size_t len)
        : SecureBuffer(len)
    {
        if (len != 0) {
            std::memcpy(ptr_, src, len);
        }
    }

    // Non-copyable
    SecureBuffer(const SecureBuffer&) = delete;
    SecureBuffer& operator=(const SecureBuffer&) = delete;

    // Movable
    SecureBuffer(SecureBuffer&& other) noexcept
        : ptr_(other.ptr_), size_(other.size_)
    {
        other.ptr_ = nullptr;
        other.size_ = 0;
    }

    SecureBuffer& operator=(SecureBuffer&& other) noexcept {
        if (this != &other) {
            cleanup();
            ptr_ = other.ptr_;
            size_ = other.size_;
            other.ptr_ = nullptr;
            other.size_ = 0;
        }
        return *this;
    }

    ~SecureBuffer() {
        cleanup();
    }

    unsigned char* data() { return ptr_; }
    const unsigned char* data() const { return ptr_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    // Copies out of locked memory; the caller owns wiping the copy.
    std::string str() const {
        if (!ptr_) return std::string();
        return std::string(reinterpret_cast<const char*>(ptr_), size_);
    }

private:
    unsigned char* ptr_ = nullptr;
    size_t size_ = 0;

    void cleanup() {
        if (ptr_) {
            sodium_memzero(ptr_, size_);
            sodium_munlock(ptr_, size_);
            sodium_free(ptr_);
            ptr_ = nullptr;
        }
    }
};
