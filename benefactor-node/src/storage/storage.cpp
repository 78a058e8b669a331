#include "benefactor/storage.hpp"
#include "benefactor/logging.hpp"
#include <algorithm>
#include <filesystem>
#include <iterator>
#include <stdexcept>
#ifdef _WIN32
#include <direct.h>
#define MKDIR(dir) _mkdir(dir)
#else
#include <sys/stat.h>
#define MKDIR(dir) mkdir(dir, 0777)
#endif

namespace benefactor {
namespace storage {

// ============================================================================
// MemoryDatabase Implementation
// ============================================================================

bool MemoryDatabase::put(const Bytes& key, const Bytes& value) {
    std::unique_lock lock(mutex_);
    data_[key] = value;
    return true;
}

std::optional<Bytes> MemoryDatabase::get(const Bytes& key) {
    std::shared_lock lock(mutex_);
    auto it = data_.find(key);
    if (it != data_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool MemoryDatabase::del(const Bytes& key) {
    std::unique_lock lock(mutex_);
    return data_.erase(key) > 0;
}

bool MemoryDatabase::exists(const Bytes& key) {
    std::shared_lock lock(mutex_);
    return data_.find(key) != data_.end();
}

bool MemoryDatabase::write_batch(const WriteBatch& batch) {
    std::unique_lock lock(mutex_);
    for (const auto& [key, value] : batch.puts) {
        data_[key] = value;
    }
    for (const auto& key : batch.deletes) {
        data_.erase(key);
    }
    return true;
}

/**
 * Copies the matching range so the scan stays valid while writers
 * continue on the source map.
 */
class PrefixIterator : public Database::Iterator {
public:
    PrefixIterator(const std::map<Bytes, Bytes>& data, const Bytes& prefix) {
        for (auto it = data.lower_bound(prefix); it != data.end(); ++it) {
            if (it->first.size() < prefix.size() ||
                !std::equal(prefix.begin(), prefix.end(), it->first.begin())) {
                break;
            }
            entries_.push_back(*it);
        }
    }

    bool valid() override { return pos_ < entries_.size(); }
    void next() override { if (pos_ < entries_.size()) ++pos_; }
    Bytes key() override { return entries_[pos_].first; }
    Bytes value() override { return entries_[pos_].second; }

private:
    std::vector<std::pair<Bytes, Bytes>> entries_;
    size_t pos_{0};
};

std::unique_ptr<Database::Iterator> MemoryDatabase::new_iterator(const Bytes& prefix) {
    std::shared_lock lock(mutex_);
    return std::make_unique<PrefixIterator>(data_, prefix);
}

// ============================================================================
// PersistentDatabase Implementation
// ============================================================================
//
// Log record: u32 payload length (LE) || payload
// Payload:    u32 put count || (u32 klen || key || u32 vlen || value)*
//             u32 delete count || (u32 klen || key)*

static void write_u32(Bytes& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
    }
}

static bool read_u32(const Bytes& in, size_t& offset, uint32_t& v) {
    if (offset + 4 > in.size()) return false;
    v = 0;
    for (int i = 0; i < 4; ++i) {
        v |= static_cast<uint32_t>(in[offset + i]) << (8 * i);
    }
    offset += 4;
    return true;
}

static bool read_chunk(const Bytes& in, size_t& offset, Bytes& out) {
    uint32_t len;
    if (!read_u32(in, offset, len) || len > in.size() - offset) return false;
    out.assign(in.begin() + offset, in.begin() + offset + len);
    offset += len;
    return true;
}

PersistentDatabase::PersistentDatabase(const std::string& path) : path_(path) {
    // Ensure directory exists
    size_t last_slash = path.find_last_of("/\\");
    if (last_slash != std::string::npos) {
        std::string dir = path.substr(0, last_slash);
        MKDIR(dir.c_str());
    }
    load();
    file_.open(path_, std::ios::binary | std::ios::app);
    if (!file_.is_open()) {
        BENEFACTOR_LOG(Error, "STORAGE") << "Cannot open " << path_ << " for writing";
    }
}

PersistentDatabase::~PersistentDatabase() {
    if (file_.is_open()) file_.close();
}

void PersistentDatabase::load() {
    std::ifstream infile(path_, std::ios::binary);
    if (!infile.is_open()) return;

    Bytes contents((std::istreambuf_iterator<char>(infile)), std::istreambuf_iterator<char>());
    size_t offset = 0;
    size_t records = 0;
    std::optional<size_t> torn_at;

    while (offset < contents.size()) {
        Bytes payload;
        size_t record_start = offset;
        if (!read_chunk(contents, offset, payload)) {
            BENEFACTOR_LOG(Warn, "STORAGE") << "Dropping torn record at offset " << record_start
                                            << " in " << path_;
            torn_at = record_start;
            break;
        }

        size_t p = 0;
        uint32_t puts = 0;
        uint32_t dels = 0;
        std::vector<std::pair<Bytes, Bytes>> staged_puts;
        std::vector<Bytes> staged_dels;
        bool ok = read_u32(payload, p, puts);
        for (uint32_t i = 0; ok && i < puts; ++i) {
            Bytes key, value;
            ok = read_chunk(payload, p, key) && read_chunk(payload, p, value);
            if (ok) staged_puts.emplace_back(std::move(key), std::move(value));
        }
        ok = ok && read_u32(payload, p, dels);
        for (uint32_t i = 0; ok && i < dels; ++i) {
            Bytes key;
            ok = read_chunk(payload, p, key);
            if (ok) staged_dels.push_back(std::move(key));
        }
        if (!ok || p != payload.size()) {
            throw std::runtime_error("corrupt log record #" + std::to_string(records) + " in " + path_);
        }

        for (auto& [key, value] : staged_puts) {
            data_[key] = std::move(value);
        }
        for (const auto& key : staged_dels) {
            data_.erase(key);
        }
        ++records;
    }
    infile.close();

    // New records must follow the last complete one
    if (torn_at) {
        std::filesystem::resize_file(path_, *torn_at);
    }

    BENEFACTOR_LOG(Debug, "STORAGE") << "Replayed " << records << " records from " << path_;
}

bool PersistentDatabase::append_log(const WriteBatch& batch) {
    if (!file_.is_open()) return false;

    Bytes payload;
    write_u32(payload, static_cast<uint32_t>(batch.puts.size()));
    for (const auto& [key, value] : batch.puts) {
        write_u32(payload, static_cast<uint32_t>(key.size()));
        payload.insert(payload.end(), key.begin(), key.end());
        write_u32(payload, static_cast<uint32_t>(value.size()));
        payload.insert(payload.end(), value.begin(), value.end());
    }
    write_u32(payload, static_cast<uint32_t>(batch.deletes.size()));
    for (const auto& key : batch.deletes) {
        write_u32(payload, static_cast<uint32_t>(key.size()));
        payload.insert(payload.end(), key.begin(), key.end());
    }

    Bytes record;
    write_u32(record, static_cast<uint32_t>(payload.size()));
    record.insert(record.end(), payload.begin(), payload.end());

    file_.write(reinterpret_cast<const char*>(record.data()), static_cast<std::streamsize>(record.size()));
    file_.flush();
    return file_.good();
}

bool PersistentDatabase::put(const Bytes& key, const Bytes& value) {
    WriteBatch batch;
    batch.puts.emplace_back(key, value);
    return write_batch(batch);
}

std::optional<Bytes> PersistentDatabase::get(const Bytes& key) {
    std::shared_lock lock(mutex_);
    auto it = data_.find(key);
    if (it != data_.end()) return it->second;
    return std::nullopt;
}

bool PersistentDatabase::del(const Bytes& key) {
    {
        std::shared_lock lock(mutex_);
        if (data_.find(key) == data_.end()) return false;
    }
    WriteBatch batch;
    batch.deletes.push_back(key);
    return write_batch(batch);
}

bool PersistentDatabase::exists(const Bytes& key) {
    std::shared_lock lock(mutex_);
    return data_.find(key) != data_.end();
}

bool PersistentDatabase::write_batch(const WriteBatch& batch) {
    std::unique_lock lock(mutex_);

    // Log first: memory only reflects what is durable
    if (!append_log(batch)) {
        BENEFACTOR_LOG(Error, "STORAGE") << "Write to " << path_ << " failed";
        return false;
    }
    for (const auto& [key, value] : batch.puts) {
        data_[key] = value;
    }
    for (const auto& key : batch.deletes) {
        data_.erase(key);
    }
    return true;
}

std::unique_ptr<Database::Iterator> PersistentDatabase::new_iterator(const Bytes& prefix) {
    std::shared_lock lock(mutex_);
    return std::make_unique<PrefixIterator>(data_, prefix);
}

// ============================================================================
// StateStore Implementation
// ============================================================================

static const uint8_t DB_NAMESPACE = 'D';
static const uint8_t DB_META = 'm';
static const uint8_t DB_TOKEN = 't';
static const uint8_t DB_ROSTER = 'o';
static const uint8_t DB_RECORD = 'r';
static const uint8_t DB_TOTAL = 'c';
static const uint8_t DB_INVOICE = 'i';

static Bytes make_prefix(uint8_t kind) {
    return {DB_NAMESPACE, kind};
}

static Bytes make_index_key(uint8_t kind, uint64_t index) {
    Bytes key = make_prefix(kind);
    codec::append_uint64(key, index);
    return key;
}

static Bytes make_donor_key(uint8_t kind, const Address& donor) {
    Bytes key = make_prefix(kind);
    auto hex = donor.to_hex();
    key.insert(key.end(), hex.begin(), hex.end());
    return key;
}

void StateStore::Batch::put_meta(const Address& admin, const std::string& base_locator) {
    Bytes value;
    codec::append_address(value, admin);
    codec::append_string(value, base_locator);
    batch_.puts.emplace_back(make_prefix(DB_META), std::move(value));
}

void StateStore::Batch::put_token(const Token& token) {
    batch_.puts.emplace_back(make_index_key(DB_TOKEN, token.id), token.encode());
}

void StateStore::Batch::put_roster_entry(uint64_t index, const Address& donor) {
    Bytes value;
    codec::append_address(value, donor);
    batch_.puts.emplace_back(make_index_key(DB_ROSTER, index), std::move(value));
}

void StateStore::Batch::put_record(const DonationRecord& record) {
    batch_.puts.emplace_back(make_donor_key(DB_RECORD, record.donor), record.encode());
}

void StateStore::Batch::put_total(const Address& donor, const Amount& total) {
    Bytes value;
    codec::append_address(value, donor);
    codec::append_amount(value, total);
    batch_.puts.emplace_back(make_donor_key(DB_TOTAL, donor), std::move(value));
}

void StateStore::Batch::put_invoice_token(const Address& donor, TokenId id) {
    Bytes value;
    codec::append_address(value, donor);
    codec::append_uint64(value, id);
    batch_.puts.emplace_back(make_donor_key(DB_INVOICE, donor), std::move(value));
}

StateStore::StateStore(std::shared_ptr<Database> db) : db_(std::move(db)) {}

bool StateStore::commit(const Batch& batch) {
    if (batch.empty()) return true;
    return db_->write_batch(batch.batch_);
}

std::optional<StoredState> StateStore::load() const {
    auto meta = db_->get(make_prefix(DB_META));
    if (!meta) {
        return std::nullopt;
    }

    auto corrupt = [](const std::string& what) {
        return std::runtime_error("state store: corrupt " + what);
    };

    StoredState state;
    {
        codec::Reader reader(*meta);
        auto admin = reader.read_address();
        auto base = reader.read_string();
        if (!admin || !base) throw corrupt("metadata");
        state.registry.admin = *admin;
        state.registry.base_locator = *base;
    }

    // Big-endian index keys iterate in id order
    for (auto it = db_->new_iterator(make_prefix(DB_TOKEN)); it->valid(); it->next()) {
        auto token = Token::decode(it->value());
        if (!token || token->id != state.registry.tokens.size()) throw corrupt("token table");
        state.registry.tokens.push_back(std::move(*token));
    }

    for (auto it = db_->new_iterator(make_prefix(DB_TOTAL)); it->valid(); it->next()) {
        auto value = it->value();
        codec::Reader reader(value);
        auto donor = reader.read_address();
        auto total = reader.read_amount();
        if (!donor || !total) throw corrupt("donation totals");
        state.registry.totals.push_back(registry::DonorTotal{*donor, *total});
    }

    for (auto it = db_->new_iterator(make_prefix(DB_ROSTER)); it->valid(); it->next()) {
        auto value = it->value();
        codec::Reader reader(value);
        auto donor = reader.read_address();
        if (!donor) throw corrupt("roster");
        state.ledger.roster.push_back(*donor);
    }

    for (auto it = db_->new_iterator(make_prefix(DB_RECORD)); it->valid(); it->next()) {
        auto record = DonationRecord::decode(it->value());
        if (!record) throw corrupt("donation records");
        state.ledger.records.push_back(std::move(*record));
    }

    for (auto it = db_->new_iterator(make_prefix(DB_INVOICE)); it->valid(); it->next()) {
        auto value = it->value();
        codec::Reader reader(value);
        auto donor = reader.read_address();
        auto id = reader.read_uint64();
        if (!donor || !id || *id >= state.registry.tokens.size()) throw corrupt("invoice index");
        state.invoice_tokens.emplace_back(*donor, *id);
    }

    BENEFACTOR_LOG(Info, "STORAGE") << "Loaded " << state.registry.tokens.size() << " tokens, "
                                    << state.ledger.roster.size() << " donors";
    return state;
}

} // namespace storage
} // namespace benefactor
