#ifndef JSON_FILE_LEDGER_STORE_HPP
#define JSON_FILE_LEDGER_STORE_HPP

#include <string>
#include "store/memory_ledger_store.hpp"

/**
 * Durable ledger store backed by a single JSON document.
 *
 * open() loads the document (or writes an empty one when the file does not
 * exist yet). Every commit rewrites the document through a temp file and a
 * rename, so a crash leaves either the old or the new ledger on disk.
 */
class JsonFileLedgerStore : public MemoryLedgerStore {
public:
    explicit JsonFileLedgerStore(const std::string& path,
                                 std::chrono::milliseconds lockTimeout = std::chrono::milliseconds(2000));

    // throws StoreError if the file is unreadable, corrupt or not writable
    void open();

    const std::string& path() const { return path_; }

    std::string describe() const override { return "file:" + path_; }

protected:
    void persistLocked(const LedgerState& state) override;

private:
    std::string path_;
};

#endif // JSON_FILE_LEDGER_STORE_HPP
