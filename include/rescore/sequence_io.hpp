#pragma once

#include <memory>
#include <string>
#include <vector>

namespace rescore {

/**
 * Sequence record from FASTA/FASTQ file
 */
struct SequenceRecord {
    std::string id;
    std::string description;
    std::string sequence;
    std::string quality;  // Only for FASTQ
};

/**
 * FASTA/FASTQ file reader
 *
 * Supports:
 * - Uncompressed and gzip-compressed (.gz) files
 * - FASTA (multi-line) and FASTQ (4-line) records
 */
class SequenceReader {
public:
    enum class Format { FASTA, FASTQ, UNKNOWN };

    /**
     * Open a sequence file (auto-detects format)
     * Throws std::runtime_error if the file cannot be opened, or if its
     * first non-blank byte is neither '>' nor '@'
     */
    explicit SequenceReader(const std::string& filename);
    ~SequenceReader();

    SequenceReader(const SequenceReader&) = delete;
    SequenceReader& operator=(const SequenceReader&) = delete;

    /**
     * Read next sequence
     * Returns false when end of file is reached
     */
    bool read_next(SequenceRecord& record);

    /**
     * Read up to max_records into batch (cleared first)
     * Returns number of records read
     */
    size_t read_batch(std::vector<SequenceRecord>& batch, size_t max_records);

    std::vector<SequenceRecord> read_all();

    bool is_open() const;
    Format get_format() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace rescore
