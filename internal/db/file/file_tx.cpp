#include "file_tx.hpp"

#include <stdexcept>

#include "internal/util/atomic_file.hpp"
#include "internal/util/proto_json.hpp"

namespace rollout::db::file {

FileTransaction::FileTransaction(FileRepository& repo) : repo_(repo), lock_(repo.mutex_) {
}

FileTransaction::~FileTransaction() {
  if (!committed_) Rollback();
}

void FileTransaction::Commit() {
  if (!lock_.owns_lock()) {
    throw std::logic_error("commit on finished transaction");
  }

  for (const auto& [id, record] : staged_) {
    const auto path = repo_.PathFor(id);
    if (record) {
      util::WriteFileAtomic(path, util::ToJson(*record));
    } else {
      std::error_code ec;
      std::filesystem::remove(path, ec);
      if (ec) {
        throw std::runtime_error("remove " + path.string() + ": " + ec.message());
      }
    }
  }

  staged_.clear();
  committed_ = true;
  lock_.unlock();
}

void FileTransaction::Rollback() {
  staged_.clear();
  if (lock_.owns_lock()) lock_.unlock();
}

} // namespace rollout::db::file
