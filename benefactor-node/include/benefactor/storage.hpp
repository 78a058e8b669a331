#pragma once

#include <memory>
#include <optional>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <fstream>
#include "benefactor/types.hpp"
#include "benefactor/registry.hpp"
#include "benefactor/ledger.hpp"

namespace benefactor {
namespace storage {

/**
 * @brief Abstract database interface
 *
 * Allows swapping between the append-only log file (production) and
 * in-memory (testing)
 */
class Database {
public:
    virtual ~Database() = default;

    virtual bool put(const Bytes& key, const Bytes& value) = 0;
    virtual std::optional<Bytes> get(const Bytes& key) = 0;
    virtual bool del(const Bytes& key) = 0;
    virtual bool exists(const Bytes& key) = 0;

    // Applied all-or-nothing
    struct WriteBatch {
        std::vector<std::pair<Bytes, Bytes>> puts;
        std::vector<Bytes> deletes;
    };
    virtual bool write_batch(const WriteBatch& batch) = 0;

    // Iterator for prefix scans, in key order
    class Iterator {
    public:
        virtual ~Iterator() = default;
        virtual bool valid() = 0;
        virtual void next() = 0;
        virtual Bytes key() = 0;
        virtual Bytes value() = 0;
    };
    virtual std::unique_ptr<Iterator> new_iterator(const Bytes& prefix) = 0;
};

/**
 * @brief In-memory database for testing
 */
class MemoryDatabase : public Database {
public:
    bool put(const Bytes& key, const Bytes& value) override;
    std::optional<Bytes> get(const Bytes& key) override;
    bool del(const Bytes& key) override;
    bool exists(const Bytes& key) override;
    bool write_batch(const WriteBatch& batch) override;
    std::unique_ptr<Iterator> new_iterator(const Bytes& prefix) override;

private:
    mutable std::shared_mutex mutex_;
    std::map<Bytes, Bytes> data_;
};

/**
 * @brief Persistent database using an append-only log file.
 *
 * A batch is written as one framed log record, so a torn write at the
 * tail is dropped as a whole on the next load.
 */
class PersistentDatabase : public Database {
public:
    explicit PersistentDatabase(const std::string& path);
    ~PersistentDatabase();

    bool put(const Bytes& key, const Bytes& value) override;
    std::optional<Bytes> get(const Bytes& key) override;
    bool del(const Bytes& key) override;
    bool exists(const Bytes& key) override;
    bool write_batch(const WriteBatch& batch) override;
    std::unique_ptr<Iterator> new_iterator(const Bytes& prefix) override;

    bool is_open() const { return file_.is_open(); }

private:
    void load();
    bool append_log(const WriteBatch& batch);

    std::string path_;
    mutable std::shared_mutex mutex_;
    std::map<Bytes, Bytes> data_;
    std::ofstream file_;
};

/**
 * @brief Everything needed to rebuild the node's in-memory state
 */
struct StoredState {
    registry::RegistryState registry;
    ledger::LedgerState ledger;
    std::vector<std::pair<Address, TokenId>> invoice_tokens;
};

/**
 * @brief Donation state persisted over a Database
 *
 * Key layout (namespace byte 'D'):
 *   'Dm'                 -> admin || base_locator
 *   'Dt' || id (8 BE)    -> Token
 *   'Do' || index (8 BE) -> roster entry (Address)
 *   'Dr' || donor        -> DonationRecord
 *   'Dc' || donor        -> donor || cumulative total
 *   'Di' || donor        -> donor || invoice token id
 *
 * Each orchestrator call stages its keys in one Batch and commits it as a
 * single write_batch.
 */
class StateStore {
public:
    explicit StateStore(std::shared_ptr<Database> db);

    // nullopt for a fresh database; throws std::runtime_error on corrupt data
    std::optional<StoredState> load() const;

    class Batch {
    public:
        void put_meta(const Address& admin, const std::string& base_locator);
        void put_token(const Token& token);
        void put_roster_entry(uint64_t index, const Address& donor);
        void put_record(const DonationRecord& record);
        void put_total(const Address& donor, const Amount& total);
        void put_invoice_token(const Address& donor, TokenId id);

        bool empty() const { return batch_.puts.empty(); }
        size_t size() const { return batch_.puts.size(); }

    private:
        friend class StateStore;
        Database::WriteBatch batch_;
    };

    bool commit(const Batch& batch);

private:
    std::shared_ptr<Database> db_;
};

} // namespace storage
} // namespace benefactor
