#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "fetchvault/error_codes.hpp"
#include "fetchvault/errors.hpp"
#include "fetchvault/store.hpp"

using namespace fetchvault;

void run_queue_tests();
void run_resume_tests();
void run_naming_tests();
void run_snapshot_tests();
void run_console_tests();

namespace
{

    std::filesystem::path fresh_root(const std::string &name)
    {
        const auto root = std::filesystem::temp_directory_path() / ("fetchvault_store_" + name);
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
        return root;
    }

    void write_json(const std::filesystem::path &path, const nlohmann::json &json)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::trunc);
        out << json.dump(2);
    }

    nlohmann::json read_json(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        return nlohmann::json::parse(in);
    }

    HistoryRecord sample_history(const std::string &id, const std::string &source, const std::string &quality)
    {
        HistoryRecord record{};
        record.id = id;
        record.source_id = source;
        record.title = "Title " + source;
        record.quality = quality;
        record.format = "mp4";
        record.completed_at = from_millis(1700000000000);
        return record;
    }

    void test_error_code_labels()
    {
        assert(to_string(ErrorCode::DuplicateJob) == "duplicate_job");
        assert(to_string(ErrorCode::StoreUnavailable) == "store_unavailable");
        assert(error_code_from_string("out_of_order_chunk") == ErrorCode::OutOfOrderChunk);
        assert(!error_code_from_string("no_such_error"));
    }

    void test_open_creates_layout()
    {
        const auto root = fresh_root("layout");
        Store store(root);
        assert(!store.is_open());
        assert(&store.open() == &store);
        assert(store.is_open());
        assert(store.schema_version() == Store::kSchemaVersion);
        assert(&store.open() == &store);

        for (const auto *file : {"schema.json", "history.json", "queue.json", "partials.json", "templates.json",
                                 "collections.json", "tags.json"})
        {
            assert(std::filesystem::exists(root / file));
        }
        assert(read_json(root / "schema.json")["version"] == Store::kSchemaVersion);

        assert(store.templates().size() == 3);
        const auto defaults = store.templates().get_all_by_index(index::kByDefault, "true");
        assert(defaults.size() == 1);
        assert(defaults.front().id == "default");
        assert(store.templates().get("detailed").pattern == "{title} - {channel} [{quality}]");
        assert(store.history().size() == 0);
        assert(store.queue().size() == 0);

        std::filesystem::remove_all(root);
    }

    void test_collection_crud_and_indices()
    {
        const auto root = fresh_root("crud");
        Store store(root);

        store.history().put(sample_history("h1", "abc", "720p"));
        store.history().put(sample_history("h2", "abc", "1080p"));
        store.history().put(sample_history("h3", "xyz", "720p"));

        assert(store.history().size() == 3);
        assert(store.history().find("h2")->quality == "1080p");
        assert(store.history().get_all_by_index(index::kBySource, "abc").size() == 2);
        assert(store.history().get_all_by_index(index::kByIdentity, identity_key("abc", "720p", "mp4")).size() == 1);
        assert(store.history().get_all_by_index(index::kBySource, "missing").empty());

        auto replaced = sample_history("h1", "abc", "480p");
        store.history().put(replaced);
        assert(store.history().size() == 3);
        assert(store.history().get("h1").quality == "480p");
        assert(store.history().get_all_by_index(index::kByIdentity, identity_key("abc", "720p", "mp4")).empty());

        assert(store.history().remove("h3"));
        assert(!store.history().remove("h3"));
        assert(!store.history().find("h3"));

        bool not_found = false;
        try
        {
            (void)store.history().get("h3");
        }
        catch (const StoreError &ex)
        {
            not_found = ex.code() == ErrorCode::NotFound;
        }
        assert(not_found);

        bool bad_index = false;
        try
        {
            (void)store.history().get_all_by_index("by-colour", "red");
        }
        catch (const StoreError &ex)
        {
            bad_index = ex.code() == ErrorCode::InvalidArgument;
        }
        assert(bad_index);

        store.history().clear();
        assert(store.history().size() == 0);
        assert(read_json(root / "history.json").empty());

        std::filesystem::remove_all(root);
    }

    void test_reopen_persists_records()
    {
        const auto root = fresh_root("reopen");
        {
            Store store(root);
            store.history().put_many({sample_history("h1", "abc", "720p"), sample_history("h2", "def", "720p")});
        }
        Store reopened(root);
        assert(reopened.history().size() == 2);
        assert(reopened.history().get("h2").source_id == "def");
        assert(reopened.history().get("h1").completed_at == from_millis(1700000000000));
        assert(!std::filesystem::exists(root / "history.json.tmp"));

        std::filesystem::remove_all(root);
    }

    void test_migration_preserves_existing_records()
    {
        const auto root = fresh_root("migrate");
        write_json(root / "schema.json", {{"version", 1}});
        write_json(root / "history.json", nlohmann::json::array({sample_history("h1", "abc", "720p")}));
        write_json(root / "queue.json", nlohmann::json::array({{{"id", "queue-1"},
                                                                 {"sourceId", "abc"},
                                                                 {"status", "downloading"},
                                                                 {"kind", "audio"},
                                                                 {"downloadedBytes", 42},
                                                                 {"enqueuedAt", 5}}}));
        write_json(root / "templates.json",
                   nlohmann::json::array({{{"id", "mine"}, {"name", "Mine"}, {"template", "{id}"}, {"isDefault", true}}}));

        Store store(root);
        store.open();
        assert(store.schema_version() == 3);
        assert(read_json(root / "schema.json")["version"] == 3);
        assert(store.history().get("h1").title == "Title abc");
        const auto item = store.queue().get("queue-1");
        assert(item.status == JobStatus::Active);
        assert(item.kind == MediaKind::Audio);
        assert(item.downloaded_bytes == 42);
        assert(store.templates().size() == 1);
        assert(store.templates().get("mine").is_default);
        assert(store.partials().size() == 0);
        assert(store.collections().size() == 0);
        assert(store.tags().size() == 0);

        std::filesystem::remove_all(root);
    }

    void test_migration_refuses_unknown_status()
    {
        const auto root = fresh_root("migrate_bad");
        write_json(root / "schema.json", {{"version", 1}});
        write_json(root / "history.json", nlohmann::json::array());
        write_json(root / "templates.json", nlohmann::json::array());
        write_json(root / "queue.json",
                   nlohmann::json::array({{{"id", "queue-1"}, {"sourceId", "abc"}, {"status", "exploded"}}}));

        Store store(root);
        bool unavailable = false;
        try
        {
            store.open();
        }
        catch (const StoreError &ex)
        {
            unavailable = ex.code() == ErrorCode::StoreUnavailable;
        }
        assert(unavailable);
        assert(!store.is_open());
        assert(read_json(root / "queue.json").size() == 1);
        assert(read_json(root / "schema.json")["version"] == 1);

        std::filesystem::remove_all(root);
    }

    void test_identity_key_keeps_fields_apart()
    {
        assert(identity_key("abc", "720p", "mp4") == identity_key("abc", "720p", "mp4"));
        assert(identity_key("x|y", "z", "mp4") != identity_key("x", "y|z", "mp4"));
        assert(identity_key("a:1", "", "b") != identity_key("a", "1", "b"));
        assert(identity_key("", "", "") != identity_key("", "", ";"));
    }

    void test_write_document_replaces_file()
    {
        const auto root = fresh_root("write_document");
        std::filesystem::create_directories(root);
        const auto path = root / "doc.json";

        detail::write_document(path, nlohmann::json::array({1, 2}));
        detail::write_document(path, nlohmann::json::array({3}));
        assert(read_json(path) == nlohmann::json::array({3}));
        assert(!std::filesystem::exists(root / "doc.json.tmp"));

        bool failed = false;
        try
        {
            detail::write_document(root / "missing" / "doc.json", nlohmann::json::array());
        }
        catch (const StoreError &ex)
        {
            failed = ex.code() == ErrorCode::IoError;
        }
        assert(failed);
        assert(read_json(path) == nlohmann::json::array({3}));

        std::filesystem::remove_all(root);
    }

    void test_newer_schema_is_rejected()
    {
        const auto root = fresh_root("newer");
        write_json(root / "schema.json", {{"version", 99}});
        Store store(root);
        bool unavailable = false;
        try
        {
            store.open();
        }
        catch (const StoreError &ex)
        {
            unavailable = ex.code() == ErrorCode::StoreUnavailable;
        }
        assert(unavailable);

        std::filesystem::remove_all(root);
    }

    void test_corrupt_collection_is_fatal()
    {
        const auto root = fresh_root("corrupt");
        {
            Store store(root);
            store.open();
        }
        {
            std::ofstream out(root / "history.json", std::ios::trunc);
            out << "{not json";
        }
        Store store(root);
        bool unavailable = false;
        try
        {
            (void)store.history();
        }
        catch (const StoreError &ex)
        {
            unavailable = ex.code() == ErrorCode::StoreUnavailable;
        }
        assert(unavailable);

        std::filesystem::remove_all(root);
    }

} // namespace

int main()
{
    try
    {
        test_error_code_labels();
        test_open_creates_layout();
        test_collection_crud_and_indices();
        test_reopen_persists_records();
        test_migration_preserves_existing_records();
        test_migration_refuses_unknown_status();
        test_identity_key_keeps_fields_apart();
        test_write_document_replaces_file();
        test_newer_schema_is_rejected();
        test_corrupt_collection_is_fatal();
        run_queue_tests();
        run_resume_tests();
        run_naming_tests();
        run_snapshot_tests();
        run_console_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
