#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <initializer_list>
#include <string_view>
#include <unordered_set>

namespace market::db::sqlite {

using market::db::ErrorCode;
using market::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s) BindText(st, idx, *s);
    else sqlite3_bind_null(st, idx);
}

static void BindOptBlob(sqlite3_stmt* st, int idx, const std::optional<model::Hash>& h) {
    if (h) sqlite3_bind_blob(st, idx, h->data(), static_cast<int>(h->size()), SQLITE_TRANSIENT);
    else sqlite3_bind_null(st, idx);
}

static void BindBlob(sqlite3_stmt* st, int idx, const model::Hash& h) {
    sqlite3_bind_blob(st, idx, h.data(), static_cast<int>(h.size()), SQLITE_TRANSIENT);
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

static void BindTime(sqlite3_stmt* st, int idx, util::TimePoint tp) {
    BindI64(st, idx, util::ToUnixMicros(tp));
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(sqlite3_column_bytes(st, col))) : "";
}

static std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColText(st, col);
}

static std::optional<model::Hash> ColOptBlob(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    const void* data = sqlite3_column_blob(st, col);
    const int   size = sqlite3_column_bytes(st, col);
    return data ? model::Hash(static_cast<const char*>(data), static_cast<std::size_t>(size)) : model::Hash{};
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
    return sqlite3_column_int64(st, col);
}

static int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

static bool ColBool(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col) != 0;
}

static util::TimePoint ColTime(sqlite3_stmt* st, int col) {
    return util::FromUnixMicros(ColI64(st, col));
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_, false);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
    return std::make_unique<SqliteTransaction>(db_, true);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

namespace {

// Steps through all rows; read errors are thrown, never dropped.
template <typename T, typename ReadRow>
std::vector<T> CollectRows(sqlite3* db, Statement& st, ReadRow read, const char* what,
                           Result (*translate)(sqlite3*, int)) {
    std::vector<T> out;
    int            rc = SQLITE_OK;
    while ((rc = st.Step()) == SQLITE_ROW) {
        out.push_back(read(st.get()));
    }
    ThrowIfDbError(translate(db, rc), what);
    return out;
}

template <typename T, typename ReadRow>
std::optional<T> SingleRow(sqlite3* db, Statement& st, ReadRow read, const char* what,
                           Result (*translate)(sqlite3*, int)) {
    const int rc = st.Step();
    if (rc == SQLITE_ROW) return read(st.get());
    ThrowIfDbError(translate(db, rc), what);
    return std::nullopt;
}

// ------------------------------------------------------------------
// Row mapping
// ------------------------------------------------------------------

constexpr const char* kAdminColumns =
    "idx,address,last_sync,category,nickname,about,can_approve_user,can_revoke_user,revoked";

model::Admin ReadAdmin(sqlite3_stmt* st) {
    model::Admin a;
    a.index            = ColI64(st, 0);
    a.address          = ColText(st, 1);
    a.last_sync        = ColTime(st, 2);
    a.category         = ColText(st, 3);
    a.nickname         = ColText(st, 4);
    a.about            = ColText(st, 5);
    a.can_approve_user = ColBool(st, 6);
    a.can_revoke_user  = ColBool(st, 7);
    a.revoked          = ColBool(st, 8);
    return a;
}

constexpr const char* kUserColumns =
    "idx,address,last_sync,status,nickname,language,specialization,telegram,portfolio,resume,about,about_hash,created_at";

model::User ReadUser(sqlite3_stmt* st) {
    model::User u;
    u.index          = ColI64(st, 0);
    u.address        = ColText(st, 1);
    u.last_sync      = ColTime(st, 2);
    u.status         = model::UserStatusFromInt(ColI32(st, 3)).value_or(model::UserStatus::Moderation);
    u.nickname       = ColText(st, 4);
    u.language       = ColText(st, 5);
    u.specialization = ColText(st, 6);
    u.telegram       = ColText(st, 7);
    u.portfolio      = ColText(st, 8);
    u.resume         = ColText(st, 9);
    u.about          = ColText(st, 10);
    u.about_hash     = ColOptBlob(st, 11);
    u.created_at     = ColTime(st, 12);
    return u;
}

constexpr const char* kOrderColumns =
    "idx,address,last_sync,status,category,language,customer_address,freelancer_address,"
    "name,name_hash,description,description_hash,technical_task,technical_task_hash,"
    "price,deadline,created_at,responses_count,arbitration_freelancer_part";

model::Order ReadOrder(sqlite3_stmt* st) {
    model::Order o;
    o.index                       = ColI64(st, 0);
    o.address                     = ColText(st, 1);
    o.last_sync                   = ColTime(st, 2);
    o.status                      = ColI32(st, 3);
    o.category                    = ColText(st, 4);
    o.language                    = ColText(st, 5);
    o.customer_address            = ColText(st, 6);
    o.freelancer_address          = ColText(st, 7);
    o.name                        = ColText(st, 8);
    o.name_hash                   = ColOptBlob(st, 9);
    o.description                 = ColText(st, 10);
    o.description_hash            = ColOptBlob(st, 11);
    o.technical_task              = ColText(st, 12);
    o.technical_task_hash         = ColOptBlob(st, 13);
    o.price                       = ColI64(st, 14);
    o.deadline                    = ColTime(st, 15);
    o.created_at                  = ColTime(st, 16);
    o.responses_count             = ColI32(st, 17);
    o.arbitration_freelancer_part = ColI32(st, 18);
    return o;
}

model::Translation ReadTranslation(sqlite3_stmt* st) {
    model::Translation t;
    t.hash            = ColOptBlob(st, 0).value_or(model::Hash{});
    t.language        = ColText(st, 1);
    t.translated_text = ColOptText(st, 2);
    t.timestamp       = ColTime(st, 3);
    return t;
}

model::OrderResponse ReadResponse(sqlite3_stmt* st) {
    model::OrderResponse r;
    r.order_index        = ColI64(st, 0);
    r.freelancer_address = ColText(st, 1);
    r.text               = ColText(st, 2);
    r.price              = ColI64(st, 3);
    r.timestamp          = ColTime(st, 4);
    return r;
}

model::OrderActivity ReadActivity(sqlite3_stmt* st) {
    model::OrderActivity a;
    a.id             = ColI64(st, 0);
    a.order_index    = ColI64(st, 1);
    a.sender_address = ColText(st, 2);
    a.op_code        = ColI32(st, 3);
    a.amount         = ColI64(st, 4);
    a.tx_hash        = ColText(st, 5);
    a.timestamp      = ColTime(st, 6);
    return a;
}

model::SyncQueueItem ReadSyncItem(sqlite3_stmt* st) {
    model::SyncQueueItem item;
    item.id            = ColI64(st, 0);
    item.entity_type   = model::EntityTypeFromInt(ColI32(st, 1)).value_or(model::EntityType::Admin);
    item.index         = ColI64(st, 2);
    item.sync_at       = ColTime(st, 3);
    item.min_last_sync = ColTime(st, 4);
    item.retry_count   = ColI32(st, 5);
    return item;
}

std::string Sql(std::initializer_list<std::string_view> parts) {
    std::string out;
    for (auto p : parts) out.append(p);
    return out;
}

} // namespace

// ------------------------------------------------------------------
// Settings
// ------------------------------------------------------------------

std::optional<model::Setting> SqliteRepository::GetSetting(Transaction& t, const std::string& key) {
    auto* db = TX(t).Handle();
    Statement st(db, "SELECT key,value FROM settings WHERE key=?;");
    BindText(st.get(), 1, key);
    return SingleRow<model::Setting>(db, st, [](sqlite3_stmt* s) { return model::Setting{ColText(s, 0), ColText(s, 1)}; },
                                     "get setting", &Translate);
}

Result SqliteRepository::UpsertSetting(Transaction& t, const model::Setting& s) {
    auto* db = TX(t).WriteHandle();
    Statement st(db, "INSERT OR REPLACE INTO settings(key,value) VALUES(?,?);");
    BindText(st.get(), 1, s.key);
    BindText(st.get(), 2, s.value);
    return Translate(db, st.Step());
}

// ------------------------------------------------------------------
// Admin
// ------------------------------------------------------------------

std::optional<model::Admin> SqliteRepository::GetAdmin(Transaction& t, int64_t index) {
    auto*      db  = TX(t).Handle();
    const auto sql = Sql({"SELECT ", kAdminColumns, " FROM admins WHERE idx=?;"});
    Statement  st(db, sql.c_str());
    BindI64(st.get(), 1, index);
    return SingleRow<model::Admin>(db, st, ReadAdmin, "get admin", &Translate);
}

Result SqliteRepository::UpsertAdmin(Transaction& t, const model::Admin& a) {
    auto*      db  = TX(t).WriteHandle();
    const auto sql = Sql({"INSERT OR REPLACE INTO admins(", kAdminColumns, ") VALUES(?,?,?,?,?,?,?,?,?);"});
    Statement  st(db, sql.c_str());
    BindI64(st.get(), 1, a.index);
    BindText(st.get(), 2, a.address);
    BindTime(st.get(), 3, a.last_sync);
    BindText(st.get(), 4, a.category);
    BindText(st.get(), 5, a.nickname);
    BindText(st.get(), 6, a.about);
    BindI32(st.get(), 7, a.can_approve_user ? 1 : 0);
    BindI32(st.get(), 8, a.can_revoke_user ? 1 : 0);
    BindI32(st.get(), 9, a.revoked ? 1 : 0);
    return Translate(db, st.Step());
}

std::vector<model::Admin> SqliteRepository::ListAdmins(Transaction& t) {
    auto*      db  = TX(t).Handle();
    const auto sql = Sql({"SELECT ", kAdminColumns, " FROM admins ORDER BY idx;"});
    Statement  st(db, sql.c_str());
    return CollectRows<model::Admin>(db, st, ReadAdmin, "list admins", &Translate);
}

// ------------------------------------------------------------------
// User
// ------------------------------------------------------------------

std::optional<model::User> SqliteRepository::GetUser(Transaction& t, int64_t index) {
    auto*      db  = TX(t).Handle();
    const auto sql = Sql({"SELECT ", kUserColumns, " FROM users WHERE idx=?;"});
    Statement  st(db, sql.c_str());
    BindI64(st.get(), 1, index);
    return SingleRow<model::User>(db, st, ReadUser, "get user", &Translate);
}

Result SqliteRepository::UpsertUser(Transaction& t, const model::User& u) {
    auto*      db  = TX(t).WriteHandle();
    const auto sql = Sql({"INSERT OR REPLACE INTO users(", kUserColumns, ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?);"});
    Statement  st(db, sql.c_str());
    BindI64(st.get(), 1, u.index);
    BindText(st.get(), 2, u.address);
    BindTime(st.get(), 3, u.last_sync);
    BindI32(st.get(), 4, static_cast<int>(u.status));
    BindText(st.get(), 5, u.nickname);
    BindText(st.get(), 6, u.language);
    BindText(st.get(), 7, u.specialization);
    BindText(st.get(), 8, u.telegram);
    BindText(st.get(), 9, u.portfolio);
    BindText(st.get(), 10, u.resume);
    BindText(st.get(), 11, u.about);
    BindOptBlob(st.get(), 12, u.about_hash);
    BindTime(st.get(), 13, u.created_at);
    return Translate(db, st.Step());
}

std::vector<model::User> SqliteRepository::ListUsers(Transaction& t) {
    auto*      db  = TX(t).Handle();
    const auto sql = Sql({"SELECT ", kUserColumns, " FROM users ORDER BY idx;"});
    Statement  st(db, sql.c_str());
    return CollectRows<model::User>(db, st, ReadUser, "list users", &Translate);
}

// ------------------------------------------------------------------
// Order
// ------------------------------------------------------------------

std::optional<model::Order> SqliteRepository::GetOrder(Transaction& t, int64_t index) {
    auto*      db  = TX(t).Handle();
    const auto sql = Sql({"SELECT ", kOrderColumns, " FROM orders WHERE idx=?;"});
    Statement  st(db, sql.c_str());
    BindI64(st.get(), 1, index);
    return SingleRow<model::Order>(db, st, ReadOrder, "get order", &Translate);
}

Result SqliteRepository::UpsertOrder(Transaction& t, const model::Order& o) {
    auto*      db  = TX(t).WriteHandle();
    const auto sql = Sql({"INSERT OR REPLACE INTO orders(", kOrderColumns, ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);"});
    Statement  st(db, sql.c_str());
    BindI64(st.get(), 1, o.index);
    BindText(st.get(), 2, o.address);
    BindTime(st.get(), 3, o.last_sync);
    BindI32(st.get(), 4, o.status);
    BindText(st.get(), 5, o.category);
    BindText(st.get(), 6, o.language);
    BindText(st.get(), 7, o.customer_address);
    BindText(st.get(), 8, o.freelancer_address);
    BindText(st.get(), 9, o.name);
    BindOptBlob(st.get(), 10, o.name_hash);
    BindText(st.get(), 11, o.description);
    BindOptBlob(st.get(), 12, o.description_hash);
    BindText(st.get(), 13, o.technical_task);
    BindOptBlob(st.get(), 14, o.technical_task_hash);
    BindI64(st.get(), 15, o.price);
    BindTime(st.get(), 16, o.deadline);
    BindTime(st.get(), 17, o.created_at);
    BindI32(st.get(), 18, o.responses_count);
    BindI32(st.get(), 19, o.arbitration_freelancer_part);
    return Translate(db, st.Step());
}

std::vector<model::Order> SqliteRepository::ListOrders(Transaction& t) {
    auto*      db  = TX(t).Handle();
    const auto sql = Sql({"SELECT ", kOrderColumns, " FROM orders ORDER BY idx;"});
    Statement  st(db, sql.c_str());
    return CollectRows<model::Order>(db, st, ReadOrder, "list orders", &Translate);
}

// ------------------------------------------------------------------
// Categories / languages
// ------------------------------------------------------------------

std::vector<model::Category> SqliteRepository::ListCategories(Transaction& t) {
    auto*     db = TX(t).Handle();
    Statement st(db, "SELECT hash,name,is_active FROM categories ORDER BY hash;");
    return CollectRows<model::Category>(
        db, st, [](sqlite3_stmt* s) { return model::Category{ColText(s, 0), ColText(s, 1), ColBool(s, 2)}; },
        "list categories", &Translate);
}

Result SqliteRepository::UpsertCategory(Transaction& t, const model::Category& c) {
    auto*     db = TX(t).WriteHandle();
    Statement st(db, "INSERT OR REPLACE INTO categories(hash,name,is_active) VALUES(?,?,?);");
    BindText(st.get(), 1, c.hash);
    BindText(st.get(), 2, c.name);
    BindI32(st.get(), 3, c.is_active ? 1 : 0);
    return Translate(db, st.Step());
}

std::vector<model::Language> SqliteRepository::ListLanguages(Transaction& t) {
    auto*     db = TX(t).Handle();
    Statement st(db, "SELECT hash,name,is_active FROM languages ORDER BY hash;");
    return CollectRows<model::Language>(
        db, st, [](sqlite3_stmt* s) { return model::Language{ColText(s, 0), ColText(s, 1), ColBool(s, 2)}; },
        "list languages", &Translate);
}

Result SqliteRepository::UpsertLanguage(Transaction& t, const model::Language& l) {
    auto*     db = TX(t).WriteHandle();
    Statement st(db, "INSERT OR REPLACE INTO languages(hash,name,is_active) VALUES(?,?,?);");
    BindText(st.get(), 1, l.hash);
    BindText(st.get(), 2, l.name);
    BindI32(st.get(), 3, l.is_active ? 1 : 0);
    return Translate(db, st.Step());
}

// ------------------------------------------------------------------
// Translations
// ------------------------------------------------------------------

std::optional<model::Translation> SqliteRepository::GetTranslation(Transaction& t, const model::Hash& hash,
                                                                   const std::string& language) {
    auto*     db = TX(t).Handle();
    Statement st(db, "SELECT hash,language,translated_text,timestamp FROM translations WHERE hash=? AND language=?;");
    BindBlob(st.get(), 1, hash);
    BindText(st.get(), 2, language);
    return SingleRow<model::Translation>(db, st, ReadTranslation, "get translation", &Translate);
}

std::vector<model::Translation> SqliteRepository::ListTranslations(Transaction& t, const std::string& language,
                                                                   const std::vector<model::Hash>& hashes) {
    // Chunked to stay under SQLITE_MAX_VARIABLE_NUMBER on old builds.
    constexpr std::size_t kChunk = 500;

    std::vector<model::Hash>        distinct;
    std::unordered_set<model::Hash> seen;
    for (const auto& h : hashes) {
        if (seen.insert(h).second) distinct.push_back(h);
    }

    auto*                           db = TX(t).Handle();
    std::vector<model::Translation> out;
    for (std::size_t begin = 0; begin < distinct.size(); begin += kChunk) {
        const auto  end = std::min(distinct.size(), begin + kChunk);
        std::string sql = "SELECT hash,language,translated_text,timestamp FROM translations WHERE language=? AND hash IN (";
        for (std::size_t i = begin; i < end; ++i) {
            sql += (i == begin) ? "?" : ",?";
        }
        sql += ");";

        Statement st(db, sql.c_str());
        BindText(st.get(), 1, language);
        for (std::size_t i = begin; i < end; ++i) {
            BindBlob(st.get(), static_cast<int>(i - begin) + 2, distinct[i]);
        }
        auto rows = CollectRows<model::Translation>(db, st, ReadTranslation, "list translations", &Translate);
        out.insert(out.end(), std::make_move_iterator(rows.begin()), std::make_move_iterator(rows.end()));
    }
    return out;
}

Result SqliteRepository::UpsertTranslation(Transaction& t, const model::Translation& tr) {
    auto*     db = TX(t).WriteHandle();
    Statement st(db, "INSERT OR REPLACE INTO translations(hash,language,translated_text,timestamp) VALUES(?,?,?,?);");
    BindBlob(st.get(), 1, tr.hash);
    BindText(st.get(), 2, tr.language);
    BindOptText(st.get(), 3, tr.translated_text);
    BindTime(st.get(), 4, tr.timestamp);
    return Translate(db, st.Step());
}

// ------------------------------------------------------------------
// Order responses
// ------------------------------------------------------------------

std::vector<model::OrderResponse> SqliteRepository::ListOrderResponses(Transaction& t, int64_t order_index) {
    auto*     db = TX(t).Handle();
    Statement st(db,
                 "SELECT order_index,freelancer_address,text,price,timestamp FROM order_responses"
                 " WHERE order_index=? ORDER BY timestamp;");
    BindI64(st.get(), 1, order_index);
    return CollectRows<model::OrderResponse>(db, st, ReadResponse, "list order responses", &Translate);
}

std::optional<model::OrderResponse> SqliteRepository::GetOrderResponse(Transaction& t, int64_t order_index,
                                                                       const std::string& freelancer_address) {
    auto*     db = TX(t).Handle();
    Statement st(db,
                 "SELECT order_index,freelancer_address,text,price,timestamp FROM order_responses"
                 " WHERE order_index=? AND freelancer_address=?;");
    BindI64(st.get(), 1, order_index);
    BindText(st.get(), 2, freelancer_address);
    return SingleRow<model::OrderResponse>(db, st, ReadResponse, "get order response", &Translate);
}

Result SqliteRepository::UpsertOrderResponse(Transaction& t, const model::OrderResponse& r) {
    auto*     db = TX(t).WriteHandle();
    Statement st(db,
                 "INSERT OR REPLACE INTO order_responses(order_index,freelancer_address,text,price,timestamp)"
                 " VALUES(?,?,?,?,?);");
    BindI64(st.get(), 1, r.order_index);
    BindText(st.get(), 2, r.freelancer_address);
    BindText(st.get(), 3, r.text);
    BindI64(st.get(), 4, r.price);
    BindTime(st.get(), 5, r.timestamp);
    return Translate(db, st.Step());
}

// ------------------------------------------------------------------
// Order activity
// ------------------------------------------------------------------

std::vector<model::OrderActivity> SqliteRepository::ListOrderActivitiesByOrder(Transaction& t, int64_t order_index,
                                                                               const Pagination& page) {
    auto*     db = TX(t).Handle();
    Statement st(db,
                 "SELECT id,order_index,sender_address,op_code,amount,tx_hash,timestamp FROM order_activities"
                 " WHERE order_index=? ORDER BY timestamp DESC, id DESC LIMIT ? OFFSET ?;");
    BindI64(st.get(), 1, order_index);
    BindI64(st.get(), 2, static_cast<int64_t>(page.limit));
    BindI64(st.get(), 3, static_cast<int64_t>(page.offset));
    return CollectRows<model::OrderActivity>(db, st, ReadActivity, "list order activity", &Translate);
}

std::vector<model::OrderActivity> SqliteRepository::ListOrderActivitiesBySender(Transaction& t,
                                                                                const std::string& sender_address,
                                                                                const Pagination& page) {
    auto*     db = TX(t).Handle();
    Statement st(db,
                 "SELECT id,order_index,sender_address,op_code,amount,tx_hash,timestamp FROM order_activities"
                 " WHERE sender_address=? ORDER BY timestamp DESC, id DESC LIMIT ? OFFSET ?;");
    BindText(st.get(), 1, sender_address);
    BindI64(st.get(), 2, static_cast<int64_t>(page.limit));
    BindI64(st.get(), 3, static_cast<int64_t>(page.offset));
    return CollectRows<model::OrderActivity>(db, st, ReadActivity, "list sender activity", &Translate);
}

Result SqliteRepository::InsertOrderActivity(Transaction& t, model::OrderActivity& a) {
    auto*     db = TX(t).WriteHandle();
    Statement st(db,
                 "INSERT INTO order_activities(order_index,sender_address,op_code,amount,tx_hash,timestamp)"
                 " VALUES(?,?,?,?,?,?);");
    BindI64(st.get(), 1, a.order_index);
    BindText(st.get(), 2, a.sender_address);
    BindI32(st.get(), 3, a.op_code);
    BindI64(st.get(), 4, a.amount);
    BindText(st.get(), 5, a.tx_hash);
    BindTime(st.get(), 6, a.timestamp);

    auto result = Translate(db, st.Step());
    if (result) {
        a.id = sqlite3_last_insert_rowid(db);
    }
    return result;
}

// ------------------------------------------------------------------
// Sync queue
// ------------------------------------------------------------------

Result SqliteRepository::EnqueueSync(Transaction& t, model::SyncQueueItem& item) {
    auto*     db = TX(t).WriteHandle();
    Statement st(db, "INSERT INTO sync_queue(entity_type,idx,sync_at,min_last_sync,retry_count) VALUES(?,?,?,?,?);");
    BindI32(st.get(), 1, static_cast<int>(item.entity_type));
    BindI64(st.get(), 2, item.index);
    BindTime(st.get(), 3, item.sync_at);
    BindTime(st.get(), 4, item.min_last_sync);
    BindI32(st.get(), 5, item.retry_count);

    auto result = Translate(db, st.Step());
    if (result) {
        item.id = sqlite3_last_insert_rowid(db);
    }
    return result;
}

std::optional<model::SyncQueueItem> SqliteRepository::NextSyncItem(Transaction& t) {
    auto*     db = TX(t).Handle();
    Statement st(db,
                 "SELECT id,entity_type,idx,sync_at,min_last_sync,retry_count FROM sync_queue"
                 " ORDER BY sync_at, id LIMIT 1;");
    return SingleRow<model::SyncQueueItem>(db, st, ReadSyncItem, "next sync item", &Translate);
}

std::size_t SqliteRepository::DeleteSyncItems(Transaction& t, model::EntityType type, int64_t index,
                                              util::TimePoint max_min_last_sync) {
    auto*     db = TX(t).WriteHandle();
    Statement st(db, "DELETE FROM sync_queue WHERE entity_type=? AND idx=? AND min_last_sync<=?;");
    BindI32(st.get(), 1, static_cast<int>(type));
    BindI64(st.get(), 2, index);
    BindTime(st.get(), 3, max_min_last_sync);
    ThrowIfDbError(Translate(db, st.Step()), "delete sync items");
    return static_cast<std::size_t>(sqlite3_changes(db));
}

Result SqliteRepository::UpsertSyncItem(Transaction& t, const model::SyncQueueItem& item) {
    if (item.id == 0) {
        return Result::Err(ErrorCode::InternalError, "sync item without id");
    }

    auto*     db = TX(t).WriteHandle();
    Statement st(db,
                 "INSERT OR REPLACE INTO sync_queue(id,entity_type,idx,sync_at,min_last_sync,retry_count)"
                 " VALUES(?,?,?,?,?,?);");
    BindI64(st.get(), 1, item.id);
    BindI32(st.get(), 2, static_cast<int>(item.entity_type));
    BindI64(st.get(), 3, item.index);
    BindTime(st.get(), 4, item.sync_at);
    BindTime(st.get(), 5, item.min_last_sync);
    BindI32(st.get(), 6, item.retry_count);
    return Translate(db, st.Step());
}

Result SqliteRepository::UpdateSyncItem(Transaction& t, const model::SyncQueueItem& item) {
    auto*     db = TX(t).WriteHandle();
    Statement st(db, "UPDATE sync_queue SET entity_type=?,idx=?,sync_at=?,min_last_sync=?,retry_count=? WHERE id=?;");
    BindI32(st.get(), 1, static_cast<int>(item.entity_type));
    BindI64(st.get(), 2, item.index);
    BindTime(st.get(), 3, item.sync_at);
    BindTime(st.get(), 4, item.min_last_sync);
    BindI32(st.get(), 5, item.retry_count);
    BindI64(st.get(), 6, item.id);

    auto result = Translate(db, st.Step());
    if (result && sqlite3_changes(db) == 0) {
        return Result::Err(ErrorCode::NotFound, "sync item " + std::to_string(item.id));
    }
    return result;
}

std::vector<model::SyncQueueItem> SqliteRepository::ListSyncItems(Transaction& t) {
    auto*     db = TX(t).Handle();
    Statement st(db, "SELECT id,entity_type,idx,sync_at,min_last_sync,retry_count FROM sync_queue ORDER BY sync_at, id;");
    return CollectRows<model::SyncQueueItem>(db, st, ReadSyncItem, "list sync items", &Translate);
}

} // namespace market::db::sqlite
