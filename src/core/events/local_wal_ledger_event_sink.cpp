#include "coop_ledger/core/local_wal_ledger_event_sink.h"

#include <cctype>
#include <exception>
#include <fstream>
#include <sstream>
#include <utility>

#include "coop_ledger/core/fixed_decimal.h"

namespace coop_ledger {

LocalWalLedgerEventSink::LocalWalLedgerEventSink(std::string wal_path)
    : wal_path_(std::move(wal_path)) {
    seq_ = ComputeNextSeq();
    stream_.open(wal_path_, std::ios::app);
}

LocalWalLedgerEventSink::~LocalWalLedgerEventSink() {
    Flush();
    if (stream_.is_open()) {
        stream_.close();
    }
}

bool LocalWalLedgerEventSink::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stream_.is_open();
}

bool LocalWalLedgerEventSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!stream_.is_open()) {
        return false;
    }
    stream_.flush();
    return stream_.good();
}

bool LocalWalLedgerEventSink::PublishJournalPosted(const JournalPostedEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!stream_.is_open()) {
        return false;
    }

    std::ostringstream oss;
    oss << "{"
        << "\"seq\":" << seq_++ << ","
        << "\"kind\":\"journal_posted\","
        << "\"committed_ts_ns\":" << event.committed_ts_ns << ","
        << "\"tenant_id\":\"" << EscapeJsonString(event.tenant_id) << "\","
        << "\"journal_entry_id\":\"" << EscapeJsonString(event.journal_entry_id) << "\","
        << "\"entry_number\":\"" << EscapeJsonString(event.entry_number) << "\","
        << "\"description\":\"" << EscapeJsonString(event.description) << "\","
        << "\"effective_date\":\"" << EscapeJsonString(event.effective_date) << "\","
        << "\"total_debit\":"
        << FixedDecimal::FormatCents(FixedDecimal::ToCents(event.total_debit)) << ","
        << "\"lines\":[";
    for (std::size_t i = 0; i < event.lines.size(); ++i) {
        const auto& line = event.lines[i];
        if (i > 0) {
            oss << ",";
        }
        oss << "{\"account_id\":\"" << EscapeJsonString(line.account_id) << "\","
            << "\"debit\":" << FixedDecimal::FormatCents(FixedDecimal::ToCents(line.debit))
            << ",\"credit\":" << FixedDecimal::FormatCents(FixedDecimal::ToCents(line.credit))
            << ",\"balance\":" << FixedDecimal::FormatCents(FixedDecimal::ToCents(line.balance))
            << "}";
    }
    oss << "]}\n";

    stream_ << oss.str();
    return stream_.good();
}

std::string LocalWalLedgerEventSink::EscapeJsonString(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (const char ch : input) {
        switch (ch) {
            case '\\':
                out.append("\\\\");
                break;
            case '"':
                out.append("\\\"");
                break;
            case '\n':
                out.append("\\n");
                break;
            case '\r':
                out.append("\\r");
                break;
            case '\t':
                out.append("\\t");
                break;
            default:
                out.push_back(ch);
                break;
        }
    }
    return out;
}

std::uint64_t LocalWalLedgerEventSink::ComputeNextSeq() const {
    std::ifstream in(wal_path_);
    if (!in.is_open()) {
        return 0;
    }

    std::uint64_t max_seq = 0;
    std::string line;
    while (std::getline(in, line)) {
        const auto key_pos = line.find("\"seq\":");
        if (key_pos == std::string::npos) {
            continue;
        }
        std::size_t pos = key_pos + 6;
        std::size_t end = pos;
        while (end < line.size() && std::isdigit(static_cast<unsigned char>(line[end])) != 0) {
            ++end;
        }
        if (end == pos) {
            continue;
        }
        try {
            const auto parsed = static_cast<std::uint64_t>(
                std::stoull(line.substr(pos, end - pos)));
            if (parsed >= max_seq) {
                max_seq = parsed + 1;
            }
        } catch (const std::exception&) {
            continue;
        }
    }
    return max_seq;
}

}  // namespace coop_ledger
