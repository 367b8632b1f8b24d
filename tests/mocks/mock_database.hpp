#pragma once

#include "db/iconnection_factory.hpp"
#include "db/idb_connection.hpp"
#include "db/iquery_executor.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace nlsql::testing {

/**
 * @brief What every MockConnection of one MockFactory reports into
 *
 * Tests configure the responder and inspect the counters after the fact.
 */
struct MockDatabase {
    using Responder = std::function<DbResultSet(const std::string& sql)>;

    std::mutex mutex;
    Responder responder;
    std::vector<std::string> executed;          // statements, in order
    std::vector<uint32_t> timeouts_applied;

    std::atomic<int> connections_created{0};
    std::atomic<int> connections_closed{0};
    std::atomic<int> cancels{0};
    std::atomic<int> health_checks{0};
    std::atomic<bool> healthy{true};
    std::atomic<bool> link_up{true};            // false: every open connection reports disconnected

    // Connect failure injected by the factory
    bool fail_connect = false;
    ErrorCode connect_error = ErrorCode::CONNECTION_REFUSED;
    std::string connect_message = "Connection refused";

    // While blocking, execute() waits until unblock() or cancel()
    std::condition_variable block_cv;
    bool blocking = false;
    int in_execute = 0;

    void block() {
        std::lock_guard lock(mutex);
        blocking = true;
    }

    void unblock() {
        {
            std::lock_guard lock(mutex);
            blocking = false;
        }
        block_cv.notify_all();
    }

    /// Wait until `count` statements are parked inside execute()
    bool wait_for_executing(int count, std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
        std::unique_lock lock(mutex);
        return block_cv.wait_for(lock, timeout, [&] { return in_execute >= count; });
    }

    std::vector<std::string> statements() {
        std::lock_guard lock(mutex);
        return executed;
    }
};

inline DbResultSet make_rows(std::vector<std::string> columns, std::vector<Row> rows) {
    DbResultSet rs;
    rs.success = true;
    rs.column_names = std::move(columns);
    rs.rows = std::move(rows);
    rs.has_rows = true;
    return rs;
}

inline DbResultSet make_failure(std::string sql_state, std::string message) {
    DbResultSet rs;
    rs.success = false;
    rs.sql_state = std::move(sql_state);
    rs.error_message = std::move(message);
    return rs;
}

class MockConnection : public IDbConnection {
public:
    explicit MockConnection(std::shared_ptr<MockDatabase> db) : db_(std::move(db)) {}

    DbResultSet execute(const std::string& sql) override {
        MockDatabase::Responder responder;
        {
            std::unique_lock lock(db_->mutex);
            db_->executed.push_back(sql);
            if (db_->blocking) {
                ++db_->in_execute;
                db_->block_cv.notify_all();
                db_->block_cv.wait(lock, [this] { return !db_->blocking || cancelled_; });
                --db_->in_execute;
                if (cancelled_) {
                    cancelled_ = false;
                    return make_failure("57014", "canceling statement due to user request");
                }
            }
            responder = db_->responder;
        }

        if (responder) {
            return responder(sql);
        }
        DbResultSet rs;
        rs.success = true;
        return rs;
    }

    bool is_healthy(const std::string&) override {
        db_->health_checks.fetch_add(1);
        return connected_ && db_->healthy.load();
    }

    bool is_connected() const override { return connected_ && db_->link_up.load(); }

    bool set_query_timeout(uint32_t timeout_ms) override {
        std::lock_guard lock(db_->mutex);
        db_->timeouts_applied.push_back(timeout_ms);
        return true;
    }

    bool cancel() override {
        {
            std::lock_guard lock(db_->mutex);
            cancelled_ = true;
        }
        db_->cancels.fetch_add(1);
        db_->block_cv.notify_all();
        return true;
    }

    void close() override {
        if (connected_) {
            connected_ = false;
            db_->connections_closed.fetch_add(1);
        }
    }

private:
    std::shared_ptr<MockDatabase> db_;
    bool connected_ = true;
    bool cancelled_ = false;    // guarded by db_->mutex
};

class MockFactory : public IConnectionFactory {
public:
    explicit MockFactory(std::shared_ptr<MockDatabase> db = std::make_shared<MockDatabase>())
        : db_(std::move(db)) {}

    Result<std::unique_ptr<IDbConnection>> create(const std::string& dsn) override {
        {
            std::lock_guard lock(mutex_);
            last_dsn_ = dsn;
        }
        if (db_->fail_connect) {
            return Result<std::unique_ptr<IDbConnection>>::error(db_->connect_error, db_->connect_message);
        }
        db_->connections_created.fetch_add(1);
        return Result<std::unique_ptr<IDbConnection>>::ok(std::make_unique<MockConnection>(db_));
    }

    [[nodiscard]] const std::shared_ptr<MockDatabase>& db() const { return db_; }
    [[nodiscard]] int total_created() const { return db_->connections_created.load(); }
    [[nodiscard]] std::string last_dsn() const {
        std::lock_guard lock(mutex_);
        return last_dsn_;
    }

private:
    std::shared_ptr<MockDatabase> db_;
    mutable std::mutex mutex_;
    std::string last_dsn_;
};

/**
 * @brief Executor that answers from a callback without any pool
 */
class MockQueryExecutor : public IQueryExecutor {
public:
    using Handler = std::function<ExecutionOutcome(const std::string& sql)>;

    explicit MockQueryExecutor(Handler handler) : handler_(std::move(handler)) {}

    [[nodiscard]] ExecutionOutcome execute(
        const std::string& /*tenant_id*/, const std::string& /*dsn*/, const std::string& sql) override {
        {
            std::lock_guard lock(mutex_);
            statements_.push_back(sql);
        }
        return handler_(sql);
    }

    [[nodiscard]] std::vector<std::string> statements() const {
        std::lock_guard lock(mutex_);
        return statements_;
    }

    [[nodiscard]] size_t execute_count() const {
        std::lock_guard lock(mutex_);
        return statements_.size();
    }

private:
    Handler handler_;
    mutable std::mutex mutex_;
    std::vector<std::string> statements_;
};

} // namespace nlsql::testing
