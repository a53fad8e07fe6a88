#pragma once

#include <zpr/error.hpp>

#include <limits>
#include <utility>

namespace zpr {

    // Abstract base class for every caller-supplied byte destination
    // A sink either takes all of the bytes handed to it or reports why it could not
    class Sink {
      public:
        virtual ~Sink() = default;

        // Write len bytes; blocking behavior is the sink's own business
        virtual dp::Res<void> write(const dp::u8 *data, dp::usize len) = 0;
    };

    /// Sink appending to a caller-owned buffer, optionally bounded
    class BufferSink : public Sink {
      private:
        Bytes &out_;
        dp::usize capacity_;

      public:
        static constexpr dp::usize UNBOUNDED = std::numeric_limits<dp::usize>::max();

        explicit BufferSink(Bytes &out, dp::usize capacity = UNBOUNDED) : out_(out), capacity_(capacity) {}

        dp::Res<void> write(const dp::u8 *data, dp::usize len) override {
            if (len > capacity_ || out_.size() > capacity_ - len) {
                echo::trace("buffer sink full: size=", out_.size(), " capacity=", capacity_, " wanted=", len);
                return dp::result::err(dp::Error::io_error("sink full"));
            }
            out_.insert(out_.end(), data, data + len);
            return dp::result::ok();
        }

        const Bytes &buffer() const { return out_; }
    };

    /// Sink writing straight to a file descriptor (socket, pipe, file)
    class FdSink : public Sink {
      private:
        dp::i32 fd_;

      public:
        explicit FdSink(dp::i32 fd) : fd_(fd) {}

        dp::Res<void> write(const dp::u8 *data, dp::usize len) override { return write_exact(fd_, data, len); }

        dp::i32 fd() const { return fd_; }
    };

    /// Sink that only counts; used to size a value before writing it for real
    class CountingSink : public Sink {
      private:
        dp::usize count_;

      public:
        CountingSink() : count_(0) {}

        dp::Res<void> write(const dp::u8 *, dp::usize len) override {
            count_ += len;
            return dp::result::ok();
        }

        dp::usize count() const { return count_; }
    };

    // ============================================================================
    // Primitive writers - each returns the number of bytes the sink accepted
    // ============================================================================

    inline Res<dp::usize> write_bytes(Sink &sink, const dp::u8 *data, dp::usize len) {
        auto res = sink.write(data, len);
        if (res.is_err()) {
            echo::error("sink write of ", len, " bytes failed: ", res.error().message.c_str());
            return dp::result::err(Error::write_error(res.error()));
        }
        return dp::result::ok(len);
    }

    inline Res<dp::usize> write_u8(Sink &sink, dp::u8 value) { return write_bytes(sink, &value, 1); }

    inline Res<dp::usize> write_u16(Sink &sink, dp::u16 value) {
        auto bytes = encode_u16_be(value);
        return write_bytes(sink, bytes.data(), bytes.size());
    }

    inline Res<dp::usize> write_u32(Sink &sink, dp::u32 value) {
        auto bytes = encode_u32_be(value);
        return write_bytes(sink, bytes.data(), bytes.size());
    }

    inline Res<dp::usize> write_u64(Sink &sink, dp::u64 value) {
        auto bytes = encode_u64_be(value);
        return write_bytes(sink, bytes.data(), bytes.size());
    }

    /// Length-prefixed blob: [len:2][bytes:len]
    inline Res<dp::usize> write_blob(Sink &sink, const dp::u8 *data, dp::usize len) {
        if (len > 0xFFFF) {
            echo::error("blob too large for u16 length prefix: ", len);
            return dp::result::err(Error::write_error(dp::Error::invalid_argument("blob too large")));
        }
        auto len_res = write_u16(sink, static_cast<dp::u16>(len));
        if (len_res.is_err()) {
            return dp::result::err(len_res.error());
        }
        auto body_res = write_bytes(sink, data, len);
        if (body_res.is_err()) {
            return dp::result::err(body_res.error());
        }
        return dp::result::ok(len_res.value() + body_res.value());
    }

    inline Res<dp::usize> write_blob(Sink &sink, const dp::String &text) {
        return write_blob(sink, reinterpret_cast<const dp::u8 *>(text.c_str()), text.size());
    }

    // ============================================================================
    // Reader - bounds-checked cursor used by every read_from
    // ============================================================================

    class Reader {
      private:
        const dp::u8 *data_;
        dp::usize size_;
        dp::usize pos_;

        Res<const dp::u8 *> take(dp::usize n, const char *what) {
            if (n > size_ - pos_) {
                echo::error("truncated input reading ", what, ": need ", n, " have ", size_ - pos_);
                return dp::result::err(Error::truncated(dp::String("truncated input reading ") + what));
            }
            const dp::u8 *p = data_ + pos_;
            pos_ += n;
            return dp::result::ok(p);
        }

      public:
        Reader(const dp::u8 *data, dp::usize size) : data_(data), size_(size), pos_(0) {}

        explicit Reader(const Bytes &bytes) : data_(bytes.data()), size_(bytes.size()), pos_(0) {}

        Res<dp::u8> read_u8() {
            auto p = take(1, "u8");
            if (p.is_err()) {
                return dp::result::err(p.error());
            }
            return dp::result::ok(p.value()[0]);
        }

        Res<dp::u16> read_u16() {
            auto p = take(2, "u16");
            if (p.is_err()) {
                return dp::result::err(p.error());
            }
            return dp::result::ok(decode_u16_be(p.value()));
        }

        Res<dp::u32> read_u32() {
            auto p = take(4, "u32");
            if (p.is_err()) {
                return dp::result::err(p.error());
            }
            return dp::result::ok(decode_u32_be(p.value()));
        }

        Res<dp::u64> read_u64() {
            auto p = take(8, "u64");
            if (p.is_err()) {
                return dp::result::err(p.error());
            }
            return dp::result::ok(decode_u64_be(p.value()));
        }

        Res<Bytes> read_bytes(dp::usize n) {
            auto p = take(n, "bytes");
            if (p.is_err()) {
                return dp::result::err(p.error());
            }
            return dp::result::ok(Bytes(p.value(), p.value() + n));
        }

        /// Reads a [len:2][bytes:len] blob
        Res<Bytes> read_blob() {
            auto len = read_u16();
            if (len.is_err()) {
                return dp::result::err(len.error());
            }
            return read_bytes(len.value());
        }

        Res<dp::String> read_blob_string() {
            auto blob = read_blob();
            if (blob.is_err()) {
                return dp::result::err(blob.error());
            }
            const Bytes &b = blob.value();
            return dp::result::ok(dp::String(reinterpret_cast<const char *>(b.data()), b.size()));
        }

        dp::usize remaining() const { return size_ - pos_; }
        dp::usize position() const { return pos_; }
        bool at_end() const { return pos_ == size_; }

        /// Pointer to the unread tail (valid while the underlying buffer lives)
        const dp::u8 *cursor() const { return data_ + pos_; }
    };

    // ============================================================================
    // Generic helpers for any T with write_to(Sink&) and static read_from(Reader&)
    // ============================================================================

    /// Serialize value into a fresh buffer
    template <typename T> Res<Bytes> to_bytes(const T &value) {
        Bytes out;
        BufferSink sink(out);
        auto res = value.write_to(sink);
        if (res.is_err()) {
            return dp::result::err(res.error());
        }
        return dp::result::ok(std::move(out));
    }

    /// Number of bytes write_to would produce
    template <typename T> Res<dp::usize> serialized_size(const T &value) {
        CountingSink sink;
        auto res = value.write_to(sink);
        if (res.is_err()) {
            return dp::result::err(res.error());
        }
        return dp::result::ok(sink.count());
    }

    /// Deserialize a value that must occupy the whole buffer
    template <typename T> Res<T> from_bytes(const Bytes &bytes) {
        Reader reader(bytes);
        auto res = T::read_from(reader);
        if (res.is_err()) {
            return dp::result::err(res.error());
        }
        if (!reader.at_end()) {
            echo::error("trailing bytes after value: ", reader.remaining());
            return dp::result::err(Error::truncated("trailing bytes"));
        }
        return res;
    }

} // namespace zpr
