#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "csi/debug.hpp"
#include "csi/record_buffer.hpp"
#include "csi/rx/frame.hpp"
#include "csi/status.hpp"
#include "csi/utils/endian.hpp"

namespace csi::rx {

struct SessionOptions {
    bool if_report{true};
    // File mode: 0 decodes everything, K stops after K records.
    // Real-time mode (no file): 0 keeps only the latest record, K keeps the
    // first K records and rejects newer ones.
    std::size_t bufsize{0};
};

// Suffix of the wall-clock timestamp file written next to a capture.
inline constexpr const char* SIDECAR_SUFFIX = "stp";
inline constexpr std::size_t SIDECAR_ENTRY_LEN = 8;

// Parses a whole sidecar: u32 seconds + u32 microseconds per packet.
// Throws MissingSidecar / TruncatedInputError.
std::vector<double> read_sidecar(const std::filesystem::path& path, utils::ByteOrder order);

// One decoding session over a single format. `Format` supplies the
// framing (kPrefixSize, body_size), per-record decode, datagram parsing
// and the record columns; the session owns the buffer, the file cursor
// and the capacity policy.
template <class Format>
class Session {
public:
    using Records = typename Format::Records;

    Session(std::optional<std::filesystem::path> file, Format format, SessionOptions opts = {})
        : file_(std::move(file)), format_(std::move(format)), opts_(opts), records_(format_.make_records()) {
        if (opts_.bufsize) records_.reserve(opts_.bufsize);
    }

    // Decode from the cursor to the end of the file (or capacity).
    // Returns the number of records appended.
    std::size_t read(utils::ByteOrder order = utils::ByteOrder::Little) {
        if (!file_) throw Error(std::string(Format::kName) + ": read() needs a capture file");
        return decode_file(*file_, cursor_, 0, order);
    }

    // Decode `num` records (0: until end of stream or capacity) starting
    // at byte offset `pos`. Records are appended to what is already
    // buffered.
    std::size_t seek(const std::filesystem::path& file, uint64_t pos, std::size_t num,
                     utils::ByteOrder order = utils::ByteOrder::Little) {
        if (opts_.bufsize && num > opts_.bufsize)
            throw std::invalid_argument(std::string(Format::kName) + ": seek count " + std::to_string(num) +
                                        " exceeds bufsize " + std::to_string(opts_.bufsize));
        file_ = file;
        return decode_file(file, pos, num, order);
    }

    std::size_t seek(uint64_t pos, std::size_t num, utils::ByteOrder order = utils::ByteOrder::Little) {
        if (!file_) throw Error(std::string(Format::kName) + ": seek() needs a capture file");
        const auto file = *file_;
        return seek(file, pos, num, order);
    }

    // Decode one datagram. Returns the format's status code when a record
    // was written, 0 when the datagram was not stored.
    uint16_t pmsg(std::span<const uint8_t> data, utils::ByteOrder order = utils::ByteOrder::Little) {
        const bool latest_only = opts_.bufsize == 0 && !file_;
        if (!latest_only && opts_.bufsize && count_ >= opts_.bufsize) {
            report_.stop = DecodeStatus::CapacityReached;
            written_ = {count_, count_};
            return 0;
        }
        if (!in_pmsg_run_) {
            run_first_ = count_;
            in_pmsg_run_ = true;
        }
        const std::size_t slot = count_;
        records_.resize(count_ + 1);
        const Target target = target_for(slot);
        DecodeStatus st = DecodeStatus::UnrecognizedFraming;
        const uint16_t code = format_.parse_datagram(data, order, records_, target, report_, st);
        tally(st);
        if (st != DecodeStatus::Ok) {
            records_.resize(count_);
            written_ = {count_, count_};
            return code;
        }
        if (latest_only && count_ == 1) {
            records_.erase_front(1);
        } else {
            ++count_;
        }
        written_ = {count_ - 1, count_};
        return code;
    }

    // Reads `<file>stp`, fills the `stp` column for the buffered records and
    // returns the first timestamp.
    double readstp(utils::ByteOrder order = utils::ByteOrder::Little) {
        static_assert(Format::kHasSidecar, "this capture format has no timestamp sidecar");
        if (!file_) throw MissingSidecar(std::string(Format::kName) + ": no capture file to pair a sidecar with");
        auto path = *file_;
        path += SIDECAR_SUFFIX;
        const auto stp = read_sidecar(path, order);
        const std::size_t n = std::min(stp.size(), count_);
        std::copy(stp.begin(), stp.begin() + static_cast<std::ptrdiff_t>(n), records_.stp.data().begin());
        return stp.front();
    }

    std::size_t count() const { return count_; }
    std::size_t capacity() const { return opts_.bufsize; }
    uint64_t position() const { return cursor_; }
    const std::optional<std::filesystem::path>& file() const { return file_; }
    const Format& format() const { return format_; }
    const SessionOptions& options() const { return opts_; }

    const Records& records() const { return records_; }
    Records& records() { return records_; }

    // Counters of the last read/seek; pmsg keeps accumulating into it.
    const ReadReport& report() const { return report_; }

    // Rows touched by the last read/seek/pmsg, as [first, last).
    std::pair<std::size_t, std::size_t> last_written() const { return written_; }

    RecordView operator[](std::size_t i) const { return records_.view(i); }

    RecordView at(std::size_t i) const {
        if (i >= count_)
            throw std::out_of_range(std::string(Format::kName) + ": record " + std::to_string(i) +
                                    " out of range (count " + std::to_string(count_) + ")");
        return records_.view(i);
    }

    std::vector<RecordView> slice(std::size_t begin, std::size_t end) const {
        std::vector<RecordView> out;
        end = std::min(end, count_);
        for (std::size_t i = begin; i < end; ++i) out.push_back(records_.view(i));
        return out;
    }

private:
    std::optional<std::size_t> previous() const {
        if (count_ == 0) return std::nullopt;
        return count_ - 1;
    }

    Target target_for(std::size_t slot) const {
        Target t{slot, previous(), std::nullopt};
        if (slot > run_first_) t.run_previous = slot - 1;
        return t;
    }

    bool full() const { return opts_.bufsize && count_ >= opts_.bufsize; }

    void tally(DecodeStatus st) {
        switch (st) {
            case DecodeStatus::Ok: ++report_.appended; break;
            case DecodeStatus::Auxiliary: ++report_.auxiliary; break;
            case DecodeStatus::UnrecognizedFraming: ++report_.skipped; break;
            case DecodeStatus::TruncatedInput: ++report_.malformed; break;
            default: break;
        }
    }

    static std::size_t read_exact(std::istream& in, uint8_t* dst, std::size_t n) {
        in.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(n));
        return static_cast<std::size_t>(in.gcount());
    }

    // Appends one framed record. Failed decodes leave the buffer unchanged.
    DecodeStatus store(const Frame& frame) {
        const std::size_t slot = count_;
        records_.resize(count_ + 1);
        const DecodeStatus st = format_.decode(frame, records_, target_for(slot), report_);
        if (st == DecodeStatus::Ok)
            ++count_;
        else
            records_.resize(count_);
        return st;
    }

    std::size_t decode_file(const std::filesystem::path& path, uint64_t pos, std::size_t limit,
                            utils::ByteOrder order) {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) throw Error(std::string(Format::kName) + ": failed to open " + path.string());

        const uint64_t data_start = format_.open(in);
        pos = std::max(pos, data_start);
        in.seekg(static_cast<std::streamoff>(pos));

        report_ = ReadReport{};
        const std::size_t first = count_;
        run_first_ = first;
        in_pmsg_run_ = false;
        std::vector<uint8_t> prefix(Format::kPrefixSize);
        std::vector<uint8_t> body;
        uint64_t at = pos;

        while (true) {
            if (limit && count_ - first >= limit) {
                report_.stop = DecodeStatus::Ok;
                break;
            }
            if (full()) {
                report_.stop = DecodeStatus::CapacityReached;
                break;
            }
            const std::size_t got = read_exact(in, prefix.data(), prefix.size());
            if (got == 0) {
                report_.stop = DecodeStatus::EndOfStream;
                break;
            }
            if (got < prefix.size()) {
                debug::set_fail(debug::kFailShortPrefix);
                report_.stop = DecodeStatus::TruncatedInput;
                break;
            }
            const BodyLength body_len = format_.body_size(prefix, order);
            if (body_len.stop != DecodeStatus::Ok) {
                tally(body_len.stop);
                report_.stop = body_len.stop;
                break;
            }
            body.resize(body_len.len);
            if (read_exact(in, body.data(), body.size()) < body.size()) {
                debug::set_fail(debug::kFailShortBody);
                CSI_TRACEF("%s: record at %llu cut short", Format::kName, (unsigned long long)at);
                report_.stop = DecodeStatus::TruncatedInput;
                break;
            }

            const DecodeStatus st = store(Frame{prefix, body, order, at});
            tally(st);
            at += prefix.size() + body.size();
            if (st == DecodeStatus::TruncatedInput && !Format::kResyncOnMalformed) {
                report_.stop = DecodeStatus::TruncatedInput;
                break;
            }
        }

        cursor_ = at;
        written_ = {first, count_};
        if (opts_.if_report) print_report(path);
        return count_ - first;
    }

    void print_report(const std::filesystem::path& path) const {
        std::fprintf(stderr, "[%s] %s: %zu packets parsed, %zu skipped, %zu malformed (%s)\n",
                     Format::kName, path.filename().string().c_str(), report_.appended,
                     report_.skipped, report_.malformed, to_string(report_.stop));
        if (report_.dropped)
            std::fprintf(stderr, "[%s] %zu measurements dropped upstream\n", Format::kName, report_.dropped);
    }

    std::optional<std::filesystem::path> file_;
    Format format_;
    SessionOptions opts_;
    Records records_;
    std::size_t count_{0};
    uint64_t cursor_{0};
    ReadReport report_{};
    std::pair<std::size_t, std::size_t> written_{0, 0};
    std::size_t run_first_{0};
    bool in_pmsg_run_{false};
};

} // namespace csi::rx
