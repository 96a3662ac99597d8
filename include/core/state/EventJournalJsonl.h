#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>

#include "core/contracts/IEventJournal.h"

namespace zenith {
namespace core {

// 파일 기반 저널. 한 줄 = 한 이벤트, 재시작 시 마지막 seq 부터 이어서 기록
class EventJournalJsonl : public IEventJournal {
public:
    // 상대 경로는 PathUtils 기준으로 해석
    explicit EventJournalJsonl(const std::filesystem::path& file_path);

    bool append(const JournalEvent& event) override;
    std::vector<JournalEvent> readFrom(std::uint64_t seq_inclusive) override;
    std::uint64_t lastSeq() const override;

    const std::filesystem::path& path() const { return file_path_; }

    // 마지막 readFrom/재구동 시 건너뛴 손상 줄 수
    std::size_t skippedRows() const;

private:
    std::vector<JournalEvent> scan(std::uint64_t seq_inclusive);

    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
    std::size_t skipped_rows_ = 0;
};

} // namespace core
} // namespace zenith
