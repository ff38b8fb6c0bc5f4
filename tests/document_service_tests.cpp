/**
 * @file document_service_tests.cpp
 * @brief End-to-end tests of the batchGet / commit / beginTransaction / rollback handlers
 */

#include <chrono>
#include <cstdint>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>

#include "api/document_service.hpp"
#include "common/config.hpp"
#include "common/timestamp.hpp"
#include "storage/document_store.hpp"
#include "test_utils.hpp"

using namespace clouddoc;
using namespace clouddoc::api;
using namespace clouddoc::tests;
using json = nlohmann::json;

namespace {

const std::string PREFIX = "projects/demo-project/databases/(default)/documents/";
const std::string ACCOUNT = PREFIX + "accounts/alice";
const std::string OTHER = PREFIX + "accounts/bob";

json int_value(int64_t v) {
    return json{{"integerValue", std::to_string(v)}};
}

json update_write(const std::string& path, const json& fields) {
    return json{{"update", {{"name", path}, {"fields", fields}}}};
}

json commit_body(const json& writes) {
    return json{{"writes", writes}};
}

json commit_body(const json& writes, const std::string& txn) {
    return json{{"writes", writes}, {"transaction", txn}};
}

json get_body(const std::vector<std::string>& paths) {
    return json{{"documents", paths}};
}

std::string begin_txn(DocumentService& service, const json& body = json()) {
    const auto response = service.begin_transaction(body);
    if (!response.ok()) {
        throw std::runtime_error("beginTransaction failed: " + response.body.dump());
    }
    return response.body.at("transaction").get<std::string>();
}

void seed(DocumentService& service, const std::string& path, const json& fields) {
    const auto response = service.commit(commit_body(json::array({update_write(path, fields)})));
    if (!response.ok()) {
        throw std::runtime_error("seed failed: " + response.body.dump());
    }
}

std::string int_field(const json& entry, const char* field) {
    return entry.at("found").at("fields").at(field).at("integerValue").get<std::string>();
}

}  // namespace

// ============= beginTransaction =============

TEST(BeginTransaction_Basic) {
    storage::DocumentStore store;
    config::Config config;
    DocumentService service(store, config);

    const auto response = service.begin_transaction(json());
    EXPECT_EQ(response.status_code, 200);
    const auto id = response.body.at("transaction").get<std::string>();
    EXPECT_EQ(id.size(), static_cast<size_t>(32));
    EXPECT_TRUE(service.get_transaction_manager().get_transaction(id) != nullptr);

    const auto read_only =
        service.begin_transaction(json{{"options", {{"readOnly", json::object()}}}});
    EXPECT_EQ(read_only.status_code, 200);
    const auto ro_id = read_only.body.at("transaction").get<std::string>();
    EXPECT_TRUE(service.get_transaction_manager().get_transaction(ro_id)->is_read_only());
    EXPECT_TRUE(id != ro_id);
}

TEST(BeginTransaction_Retry) {
    storage::DocumentStore store;
    config::Config config;
    DocumentService service(store, config);

    const auto first = begin_txn(service);
    const auto second =
        begin_txn(service, json{{"options", {{"readWrite", {{"retryTransaction", first}}}}}});
    EXPECT_TRUE(first != second);

    /* The retried transaction is gone */
    const auto response = service.rollback(json{{"transaction", first}});
    EXPECT_EQ(response.status_code, 400);
    EXPECT_STREQ(error_message(response.body), "Invalid transaction ID");
}

TEST(BeginTransaction_BadOptions) {
    storage::DocumentStore store;
    config::Config config;
    DocumentService service(store, config);

    EXPECT_EQ(service.begin_transaction(json{{"options", "x"}}).status_code, 400);
    EXPECT_EQ(service.begin_transaction(json::array()).status_code, 400);
    EXPECT_EQ(service
                  .begin_transaction(json{{"options",
                                           {{"readOnly", json::object()},
                                            {"readWrite", json::object()}}}})
                  .status_code,
              400);
}

// ============= batchGet =============

TEST(BatchGet_FoundAndMissing) {
    storage::DocumentStore store;
    config::Config config;
    DocumentService service(store, config);
    seed(service, ACCOUNT, json{{"balance", int_value(100)}});

    const auto response = service.batch_get(get_body({ACCOUNT, OTHER}));
    EXPECT_EQ(response.status_code, 200);
    EXPECT_TRUE(response.body.is_array());
    EXPECT_EQ(response.body.size(), static_cast<size_t>(2));

    const auto& found = response.body.at(0);
    EXPECT_STREQ(found.at("found").at("name").get<std::string>(), ACCOUNT);
    EXPECT_STREQ(int_field(found, "balance"), "100");
    EXPECT_TRUE(found.at("found").contains("createTime"));
    EXPECT_TRUE(found.at("found").contains("updateTime"));
    EXPECT_TRUE(found.contains("readTime"));
    EXPECT_FALSE(found.contains("transaction"));

    const auto& missing = response.body.at(1);
    EXPECT_STREQ(missing.at("missing").get<std::string>(), OTHER);
    EXPECT_FALSE(missing.contains("found"));
}

TEST(BatchGet_Mask) {
    storage::DocumentStore store;
    config::Config config;
    DocumentService service(store, config);
    seed(service, ACCOUNT, json{{"a", int_value(1)}, {"b", int_value(2)}});

    json body = get_body({ACCOUNT});
    body["mask"] = json{{"fieldPaths", {"a"}}};
    const auto response = service.batch_get(body);
    EXPECT_EQ(response.status_code, 200);

    const auto& fields = response.body.at(0).at("found").at("fields");
    EXPECT_EQ(fields.size(), static_cast<size_t>(1));
    EXPECT_TRUE(fields.contains("a"));
}

TEST(BatchGet_Validation) {
    storage::DocumentStore store;
    config::Config config;
    config.max_batch_get_documents = 2;
    DocumentService service(store, config);

    auto response = service.batch_get(json::object());
    EXPECT_EQ(response.status_code, 400);
    EXPECT_STREQ(error_message(response.body), "documents field is required and must be an array");

    response = service.batch_get(get_body({}));
    EXPECT_EQ(response.status_code, 400);
    EXPECT_STREQ(error_message(response.body), "documents array cannot be empty");

    response = service.batch_get(get_body({ACCOUNT, OTHER, PREFIX + "accounts/carol"}));
    EXPECT_EQ(response.status_code, 400);
    EXPECT_STREQ(error_message(response.body), "documents array cannot exceed 2 items");

    response = service.batch_get(get_body({"accounts/alice"}));
    EXPECT_EQ(response.status_code, 400);
    EXPECT_STREQ(response.body.at("error").at("status").get<std::string>(), "INVALID_ARGUMENT");

    response = service.batch_get(get_body({"projects/p/databases/other/documents/a/b"}));
    EXPECT_EQ(response.status_code, 404);
    EXPECT_STREQ(error_message(response.body), "Database other not found");

    response = service.batch_get(json{{"documents", {ACCOUNT}}, {"readTime", "noon"}});
    EXPECT_EQ(response.status_code, 400);

    json both = get_body({ACCOUNT});
    both["transaction"] = begin_txn(service);
    both["newTransaction"] = json::object();
    response = service.batch_get(both);
    EXPECT_EQ(response.status_code, 400);
    EXPECT_STREQ(error_message(response.body), "Cannot specify both transaction and newTransaction");

    json unknown = get_body({ACCOUNT});
    unknown["transaction"] = "0123456789abcdef0123456789abcdef";
    response = service.batch_get(unknown);
    EXPECT_EQ(response.status_code, 400);
    EXPECT_STREQ(error_message(response.body), "Invalid transaction ID");
}

TEST(BatchGet_NewTransaction) {
    storage::DocumentStore store;
    config::Config config;
    DocumentService service(store, config);
    seed(service, ACCOUNT, json{{"balance", int_value(100)}});

    json body = get_body({ACCOUNT, OTHER});
    body["newTransaction"] = json::object();
    const auto response = service.batch_get(body);
    EXPECT_EQ(response.status_code, 200);

    const auto txn = response.body.at(0).at("transaction").get<std::string>();
    EXPECT_STREQ(response.body.at(1).at("transaction").get<std::string>(), txn);

    /* The new transaction recorded both reads and can commit */
    const auto commit = service.commit(
        commit_body(json::array({update_write(ACCOUNT, json{{"balance", int_value(90)}})}), txn));
    EXPECT_EQ(commit.status_code, 200);
}

TEST(BatchGet_SnapshotRead) {
    storage::DocumentStore store;
    config::Config config;
    DocumentService service(store, config);
    seed(service, ACCOUNT, json{{"balance", int_value(100)}});

    const auto txn = begin_txn(service);
    seed(service, ACCOUNT, json{{"balance", int_value(50)}});

    json body = get_body({ACCOUNT});
    body["transaction"] = txn;
    const auto in_txn = service.batch_get(body);
    EXPECT_EQ(in_txn.status_code, 200);
    EXPECT_STREQ(int_field(in_txn.body.at(0), "balance"), "100");
    EXPECT_FALSE(in_txn.body.at(0).contains("transaction"));

    const auto txn_start =
        service.get_transaction_manager().get_transaction(txn)->get_start_time().to_string();
    EXPECT_STREQ(in_txn.body.at(0).at("readTime").get<std::string>(), txn_start);

    const auto outside = service.batch_get(get_body({ACCOUNT}));
    EXPECT_STREQ(int_field(outside.body.at(0), "balance"), "50");
}

// ============= commit =============

TEST(Commit_Basic) {
    storage::DocumentStore store;
    config::Config config;
    DocumentService service(store, config);

    const auto response = service.commit(commit_body(json::array(
        {update_write(ACCOUNT, json{{"balance", int_value(100)}}),
         json{{"transform",
               {{"document", OTHER},
                {"fieldTransforms",
                 {{{"fieldPath", "visits"}, {"increment", int_value(5)}},
                  {{"fieldPath", "seen"}, {"setToServerValue", "REQUEST_TIME"}}}}}}}})));
    EXPECT_EQ(response.status_code, 200);

    const auto& results = response.body.at("writeResults");
    EXPECT_EQ(results.size(), static_cast<size_t>(2));
    const auto commit_time = response.body.at("commitTime").get<std::string>();
    EXPECT_STREQ(results.at(0).at("updateTime").get<std::string>(), commit_time);
    EXPECT_FALSE(results.at(0).contains("transformResults"));

    const auto& transforms = results.at(1).at("transformResults");
    EXPECT_EQ(transforms.size(), static_cast<size_t>(2));
    EXPECT_EQ(transforms.at(0), int_value(5));
    EXPECT_STREQ(transforms.at(1).at("timestampValue").get<std::string>(), commit_time);

    EXPECT_EQ(store.size(), static_cast<size_t>(2));
    EXPECT_TRUE(common::Timestamp::parse(commit_time).has_value());
}

TEST(Commit_Increment) {
    storage::DocumentStore store;
    config::Config config;
    DocumentService service(store, config);
    seed(service, ACCOUNT, json{{"n", int_value(10)}, {"d", int_value(10)}});

    const auto response = service.commit(commit_body(json::array(
        {json{{"transform",
               {{"document", ACCOUNT},
                {"fieldTransforms",
                 {{{"fieldPath", "n"}, {"increment", int_value(5)}},
                  {{"fieldPath", "d"}, {"increment", {{"doubleValue", 0.5}}}}}}}}}})));
    EXPECT_EQ(response.status_code, 200);

    const auto doc = store.get(ACCOUNT);
    EXPECT_TRUE(doc->fields.at("n").is_integer());
    EXPECT_EQ(doc->fields.at("n").as_integer(), 15);
    EXPECT_TRUE(doc->fields.at("d").is_double());
    EXPECT_DOUBLE_EQ(doc->fields.at("d").as_double(), 10.5);
}

TEST(Commit_UpdateMask) {
    storage::DocumentStore store;
    config::Config config;
    DocumentService service(store, config);
    seed(service, ACCOUNT, json{{"a", int_value(1)}, {"b", int_value(2)}});

    json write = update_write(ACCOUNT, json{{"a", int_value(99)}});
    write["updateMask"] = json{{"fieldPaths", {"a"}}};
    EXPECT_EQ(service.commit(commit_body(json::array({write}))).status_code, 200);

    const auto entry = service.batch_get(get_body({ACCOUNT})).body.at(0);
    EXPECT_STREQ(int_field(entry, "a"), "99");
    EXPECT_STREQ(int_field(entry, "b"), "2");
    EXPECT_EQ(entry.at("found").at("fields").size(), static_cast<size_t>(2));
}

TEST(Commit_Delete) {
    storage::DocumentStore store;
    config::Config config;
    DocumentService service(store, config);
    seed(service, ACCOUNT, json{{"a", int_value(1)}});

    const auto response = service.commit(commit_body(json::array({json{{"delete", ACCOUNT}}})));
    EXPECT_EQ(response.status_code, 200);
    EXPECT_FALSE(store.exists(ACCOUNT));
    EXPECT_TRUE(service.batch_get(get_body({ACCOUNT})).body.at(0).contains("missing"));
}

TEST(Commit_Validation) {
    storage::DocumentStore store;
    config::Config config;
    config.max_commit_writes = 2;
    DocumentService service(store, config);

    auto response = service.commit(json::object());
    EXPECT_EQ(response.status_code, 400);
    EXPECT_STREQ(error_message(response.body), "writes field is required and must be an array");

    response = service.commit(
        commit_body(json::array({json{{"update", {{"name", ACCOUNT}}}, {"delete", ACCOUNT}}})));
    EXPECT_EQ(response.status_code, 400);
    EXPECT_STREQ(error_message(response.body),
                 "Write must specify exactly one of update, delete, or transform");

    const json one = json{{"delete", ACCOUNT}};
    response = service.commit(commit_body(json::array({one, one, one})));
    EXPECT_EQ(response.status_code, 400);
    EXPECT_STREQ(error_message(response.body), "writes array cannot exceed 2 items");

    response = service.commit(
        commit_body(json::array({update_write(ACCOUNT, json{{"a", {{"fooValue", 1}}}})})));
    EXPECT_EQ(response.status_code, 400);

    response = service.commit(commit_body(json::array(
        {json{{"transform",
               {{"document", ACCOUNT},
                {"fieldTransforms",
                 {{{"fieldPath", "t"}, {"setToServerValue", "SOMETHING_ELSE"}}}}}}}})));
    EXPECT_EQ(response.status_code, 400);

    EXPECT_EQ(store.size(), static_cast<size_t>(0));
}

TEST(Commit_Preconditions) {
    storage::DocumentStore store;
    config::Config config;
    DocumentService service(store, config);
    seed(service, ACCOUNT, json{{"a", int_value(1)}});

    json create = update_write(ACCOUNT, json{{"a", int_value(2)}});
    create["currentDocument"] = json{{"exists", false}};
    auto response = service.commit(commit_body(json::array({create})));
    EXPECT_EQ(response.status_code, 409);
    EXPECT_STREQ(response.body.at("error").at("status").get<std::string>(), "ALREADY_EXISTS");

    json must_exist = update_write(OTHER, json::object());
    must_exist["currentDocument"] = json{{"exists", true}};
    response = service.commit(commit_body(json::array({update_write(ACCOUNT, json::object()),
                                                       must_exist})));
    EXPECT_EQ(response.status_code, 400);
    EXPECT_STREQ(response.body.at("error").at("status").get<std::string>(),
                 "FAILED_PRECONDITION");

    /* The batch was rejected as a whole */
    EXPECT_EQ(store.get(ACCOUNT)->fields.size(), static_cast<size_t>(1));

    const auto update_time = store.get(ACCOUNT)->update_time.to_string();
    json guarded = update_write(ACCOUNT, json{{"a", int_value(3)}});
    guarded["currentDocument"] = json{{"updateTime", update_time}};
    EXPECT_EQ(service.commit(commit_body(json::array({guarded}))).status_code, 200);
    EXPECT_EQ(service.commit(commit_body(json::array({guarded}))).status_code, 400);
}

TEST(Commit_OptimisticConflict) {
    storage::DocumentStore store;
    config::Config config;
    DocumentService service(store, config);
    seed(service, ACCOUNT, json{{"balance", int_value(100)}});

    /* Two transactions read the same document */
    const auto first = begin_txn(service);
    const auto second = begin_txn(service);
    for (const auto& txn : {first, second}) {
        json body = get_body({ACCOUNT});
        body["transaction"] = txn;
        EXPECT_EQ(service.batch_get(body).status_code, 200);
    }

    auto response = service.commit(commit_body(
        json::array({update_write(ACCOUNT, json{{"balance", int_value(150)}})}), first));
    EXPECT_EQ(response.status_code, 200);

    response = service.commit(commit_body(
        json::array({update_write(ACCOUNT, json{{"balance", int_value(200)}})}), second));
    EXPECT_EQ(response.status_code, 409);
    EXPECT_STREQ(response.body.at("error").at("status").get<std::string>(), "ABORTED");
    EXPECT_STREQ(error_message(response.body),
                 "Transaction aborted due to conflicting modifications");

    /* The loser's writes were not applied and the transaction is finished */
    EXPECT_EQ(store.get(ACCOUNT)->fields.at("balance").as_integer(), 150);
    response = service.rollback(json{{"transaction", second}});
    EXPECT_EQ(response.status_code, 400);
    EXPECT_STREQ(error_message(response.body), "Invalid transaction ID");
}

TEST(Commit_NoReadsNoConflict) {
    storage::DocumentStore store;
    config::Config config;
    DocumentService service(store, config);
    seed(service, ACCOUNT, json{{"balance", int_value(100)}});

    const auto txn = begin_txn(service);
    seed(service, ACCOUNT, json{{"balance", int_value(1)}});

    const auto response = service.commit(commit_body(
        json::array({update_write(ACCOUNT, json{{"balance", int_value(7)}})}), txn));
    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(store.get(ACCOUNT)->fields.at("balance").as_integer(), 7);
}

TEST(Commit_TransactionStates) {
    storage::DocumentStore store;
    config::Config config;
    DocumentService service(store, config);

    const auto txn = begin_txn(service);
    EXPECT_EQ(service.commit(commit_body(json::array(), txn)).status_code, 200);

    auto response = service.commit(commit_body(json::array(), txn));
    EXPECT_EQ(response.status_code, 400);
    EXPECT_STREQ(error_message(response.body), "Invalid transaction ID");

    /* A failed commit ends the transaction too */
    const auto failing = begin_txn(service);
    json must_exist = update_write(ACCOUNT, json::object());
    must_exist["currentDocument"] = json{{"exists", true}};
    EXPECT_EQ(service.commit(commit_body(json::array({must_exist}), failing)).status_code, 400);
    response = service.commit(commit_body(json::array(), failing));
    EXPECT_STREQ(error_message(response.body), "Invalid transaction ID");
}

TEST(Commit_ReadOnly) {
    storage::DocumentStore store;
    config::Config config;
    DocumentService service(store, config);

    const auto read_only = begin_txn(service, json{{"options", {{"readOnly", json::object()}}}});
    auto response = service.commit(commit_body(
        json::array({update_write(ACCOUNT, json{{"a", int_value(1)}})}), read_only));
    EXPECT_EQ(response.status_code, 400);
    EXPECT_STREQ(error_message(response.body), "Cannot commit writes in a read-only transaction");
    EXPECT_FALSE(store.exists(ACCOUNT));

    const auto empty = begin_txn(service, json{{"options", {{"readOnly", json::object()}}}});
    EXPECT_EQ(service.commit(commit_body(json::array(), empty)).status_code, 200);
}

TEST(Commit_ConcurrentIncrements) {
    storage::DocumentStore store;
    config::Config config;
    DocumentService service(store, config);

    constexpr int THREADS = 4;
    constexpr int PER_THREAD = 25;
    const json write = json{{"transform",
                             {{"document", ACCOUNT},
                              {"fieldTransforms",
                               {{{"fieldPath", "count"}, {"increment", int_value(1)}}}}}}};

    std::vector<std::thread> workers;
    workers.reserve(THREADS);
    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([&service, &write]() {
            for (int i = 0; i < PER_THREAD; ++i) {
                static_cast<void>(service.commit(commit_body(json::array({write}))));
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }
    EXPECT_EQ(store.get(ACCOUNT)->fields.at("count").as_integer(), THREADS * PER_THREAD);
}

// ============= rollback / timeout =============

TEST(Rollback_Basic) {
    storage::DocumentStore store;
    config::Config config;
    DocumentService service(store, config);

    const auto txn = begin_txn(service);
    auto response = service.rollback(json{{"transaction", txn}});
    EXPECT_EQ(response.status_code, 200);
    EXPECT_TRUE(response.body.is_object() && response.body.empty());

    response = service.rollback(json{{"transaction", txn}});
    EXPECT_EQ(response.status_code, 400);
    EXPECT_STREQ(error_message(response.body), "Invalid transaction ID");

    response = service.rollback(json::object());
    EXPECT_EQ(response.status_code, 400);
    EXPECT_STREQ(error_message(response.body), "transaction field is required");

    response = service.commit(commit_body(json::array(), txn));
    EXPECT_STREQ(error_message(response.body), "Invalid transaction ID");
}

TEST(Transaction_Timeout) {
    storage::DocumentStore store;
    config::Config config;
    config.transaction_timeout_ms = 50;
    DocumentService service(store, config);
    seed(service, ACCOUNT, json{{"a", int_value(1)}});

    const auto txn = begin_txn(service);
    std::this_thread::sleep_for(std::chrono::milliseconds(120));

    json read = get_body({ACCOUNT});
    read["transaction"] = txn;
    auto response = service.batch_get(read);
    EXPECT_EQ(response.status_code, 400);
    EXPECT_STREQ(error_message(response.body),
                 "Transaction has already been committed or rolled back");

    response = service.commit(commit_body(json::array(), txn));
    EXPECT_EQ(response.status_code, 400);
    EXPECT_STREQ(error_message(response.body),
                 "Transaction has already been committed or rolled back");

    response = service.rollback(json{{"transaction", txn}});
    EXPECT_EQ(response.status_code, 400);
    EXPECT_STREQ(error_message(response.body), "Transaction has already been rolled back");
}

int main() {
    std::cout << "Document Service Tests" << std::endl;
    std::cout << "========================" << std::endl << std::endl;

    RUN_TEST(BeginTransaction_Basic);
    RUN_TEST(BeginTransaction_Retry);
    RUN_TEST(BeginTransaction_BadOptions);
    RUN_TEST(BatchGet_FoundAndMissing);
    RUN_TEST(BatchGet_Mask);
    RUN_TEST(BatchGet_Validation);
    RUN_TEST(BatchGet_NewTransaction);
    RUN_TEST(BatchGet_SnapshotRead);
    RUN_TEST(Commit_Basic);
    RUN_TEST(Commit_Increment);
    RUN_TEST(Commit_UpdateMask);
    RUN_TEST(Commit_Delete);
    RUN_TEST(Commit_Validation);
    RUN_TEST(Commit_Preconditions);
    RUN_TEST(Commit_OptimisticConflict);
    RUN_TEST(Commit_NoReadsNoConflict);
    RUN_TEST(Commit_TransactionStates);
    RUN_TEST(Commit_ReadOnly);
    RUN_TEST(Commit_ConcurrentIncrements);
    RUN_TEST(Rollback_Basic);
    RUN_TEST(Transaction_Timeout);

    std::cout << std::endl << "========================" << std::endl;
    std::cout << "Results: " << tests_passed << " passed, " << tests_failed << " failed"
              << std::endl;

    return (tests_failed > 0);
}
