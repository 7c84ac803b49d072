#include "rescore/sequence_io.hpp"

#include <cstring>
#include <fstream>
#include <stdexcept>
#include <utility>
#include <zlib.h>

namespace rescore {

// Large zlib buffer for better throughput
constexpr size_t GZBUF_SIZE = 4 * 1024 * 1024;

class SequenceReader::Impl {
public:
    std::ifstream file_;
    gzFile gz_file_ = nullptr;
    Format format_ = Format::UNKNOWN;
    bool is_gzipped_ = false;
    bool has_content_ = false;  // non-blank byte present
    char buffer_[65536];  // gz line buffer
    std::string lookahead_line_;  // next FASTA header
    bool has_lookahead_ = false;

    static bool has_gz_suffix(const std::string& filename) {
        return filename.size() > 3 &&
               filename.compare(filename.size() - 3, 3, ".gz") == 0;
    }

    static Format detect(char c) {
        return c == '>' ? Format::FASTA :
               c == '@' ? Format::FASTQ : Format::UNKNOWN;
    }

    // Leading blank lines are consumed before the first byte is sniffed
    bool open(const std::string& filename) {
        int c = -1;
        if (has_gz_suffix(filename)) {
            is_gzipped_ = true;
            gz_file_ = gzopen(filename.c_str(), "rb");
            if (!gz_file_) return false;
            gzbuffer(gz_file_, GZBUF_SIZE);

            do {
                c = gzgetc(gz_file_);
            } while (c == ' ' || c == '\t' || c == '\r' || c == '\n');
            if (c != -1) gzungetc(c, gz_file_);
        } else {
            file_.open(filename);
            if (!file_) return false;

            file_ >> std::ws;
            c = file_.peek();
            if (c == std::char_traits<char>::eof()) c = -1;
        }
        if (c != -1) {
            has_content_ = true;
            format_ = detect(static_cast<char>(c));
        }
        return true;
    }

    // gzgets splits lines longer than the buffer; keep reading until '\n'
    bool getline(std::string& line) {
        if (!is_gzipped_) {
            if (!std::getline(file_, line)) return false;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }

        line.clear();
        bool got_any = false;
        while (gzgets(gz_file_, buffer_, sizeof(buffer_))) {
            got_any = true;
            size_t len = strlen(buffer_);
            bool complete = len > 0 && buffer_[len - 1] == '\n';
            if (complete) len--;
            line.append(buffer_, len);
            if (complete) break;
        }
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return got_any;
    }

    bool is_open() const {
        return is_gzipped_ ? gz_file_ != nullptr : file_.is_open();
    }

    void close() {
        if (gz_file_) {
            gzclose(gz_file_);
            gz_file_ = nullptr;
        }
        if (file_.is_open()) file_.close();
    }

    ~Impl() {
        close();
    }
};

SequenceReader::SequenceReader(const std::string& filename)
    : impl_(std::make_unique<Impl>()) {
    if (!impl_->open(filename)) {
        throw std::runtime_error("Failed to open file: " + filename);
    }
    if (impl_->format_ == Format::UNKNOWN && impl_->has_content_) {
        throw std::runtime_error("Unrecognised sequence format: " + filename);
    }
}

SequenceReader::~SequenceReader() = default;

static void split_header(const std::string& line, SequenceRecord& record) {
    const char* hdr = line.c_str() + 1;  // Skip '>' or '@'
    const char* space = strpbrk(hdr, " \t");
    if (space) {
        record.id.assign(hdr, space - hdr);
        record.description.assign(space + 1);
    } else {
        record.id.assign(hdr);
        record.description.clear();
    }
}

bool SequenceReader::read_next(SequenceRecord& record) {
    std::string line;

    if (impl_->format_ == Format::FASTA) {
        if (impl_->has_lookahead_) {
            line = std::move(impl_->lookahead_line_);
            impl_->has_lookahead_ = false;
        } else if (!impl_->getline(line)) {
            return false;
        }

        // Skip empty lines
        while (line.empty()) {
            if (!impl_->getline(line)) return false;
        }

        if (line[0] != '>') {
            throw std::runtime_error("Malformed FASTA: expected '>' header, got '" +
                                     line.substr(0, 40) + "'");
        }
        split_header(line, record);
        record.quality.clear();

        // Sequence lines until next header or EOF
        record.sequence.clear();
        while (impl_->getline(line)) {
            if (line.empty()) continue;
            if (line[0] == '>') {
                impl_->lookahead_line_ = std::move(line);
                impl_->has_lookahead_ = true;
                break;
            }
            record.sequence += line;
        }
        return true;
    }

    if (impl_->format_ == Format::FASTQ) {
        // 4 lines per record
        if (!impl_->getline(line)) return false;
        while (line.empty()) {
            if (!impl_->getline(line)) return false;
        }
        if (line[0] != '@') {
            throw std::runtime_error("Malformed FASTQ: expected '@' header, got '" +
                                     line.substr(0, 40) + "'");
        }
        split_header(line, record);

        if (!impl_->getline(record.sequence) ||
            !impl_->getline(line) ||
            !impl_->getline(record.quality)) {
            throw std::runtime_error("Truncated FASTQ record: " + record.id);
        }
        return true;
    }

    return false;
}

size_t SequenceReader::read_batch(std::vector<SequenceRecord>& batch, size_t max_records) {
    batch.clear();
    SequenceRecord record;
    while (batch.size() < max_records && read_next(record)) {
        batch.push_back(std::move(record));
        record = SequenceRecord();
    }
    return batch.size();
}

std::vector<SequenceRecord> SequenceReader::read_all() {
    std::vector<SequenceRecord> records;
    SequenceRecord record;
    while (read_next(record)) {
        records.push_back(record);
    }
    return records;
}

bool SequenceReader::is_open() const {
    return impl_->is_open();
}

SequenceReader::Format SequenceReader::get_format() const {
    return impl_->format_;
}

}  // namespace rescore
