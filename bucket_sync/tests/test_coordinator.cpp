#include "logger.hpp"
#include "test_support.hpp"
#include "upload_coordinator.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

using namespace bucket_sync::agent;
using bucket_sync::test::FakeObjectStore;
using bucket_sync::test::ScratchDir;
using bucket_sync::test::touch_later;
using bucket_sync::test::wait_until;
using bucket_sync::test::write_file;
using namespace std::chrono_literals;

namespace {

CoordinatorOptions options_for(const ScratchDir& work) {
    CoordinatorOptions options;
    options.state_file = work / "state.json";
    options.log_dir = work / "logs";
    options.scan_interval = 100ms;
    options.monitor_stop_timeout = 2s;
    options.uploader.max_workers = 2;
    options.uploader.chunk_size = 32;
    options.uploader.put_retry = RetryPolicy{3, 0ms, 0ms};
    options.uploader.part_retry = options.uploader.put_retry;
    return options;
}

// Puts take long enough for a shutdown to land in the middle of one.
class SlowStore : public FakeObjectStore {
public:
    std::string put_object(const std::string& bucket,
                           const std::string& key,
                           std::span<const std::byte> body,
                           const ObjectMetadata& metadata) override {
        put_started_ = true;
        std::this_thread::sleep_for(400ms);
        return FakeObjectStore::put_object(bucket, key, body, metadata);
    }

    bool put_started() const { return put_started_; }

private:
    std::atomic<bool> put_started_{false};
};

}  // namespace

void test_start_uploads_existing_files() {
    ScratchDir work("coordinator_start");
    const auto source = work / "src";
    write_file(source / "x.txt", "x");
    write_file(source / "nested/y.txt", "y");

    Logger logger;
    FakeObjectStore store;
    {
        UploadCoordinator coordinator(options_for(work), store, logger);
        RequestMetadata metadata;
        metadata.type = "backup";
        coordinator.start_upload(UploadRequest("U", source, "bucket", "**/*.txt", metadata));

        const auto state = coordinator.tracker().get_state("U");
        assert(state->completed_files.size() == 2);
        assert(state->is_completed((source / "x.txt").string()));
        assert(store.has_object("bucket", "x.txt"));
        assert(store.has_object("bucket", "nested/y.txt"));
        assert(store.object("bucket", "x.txt").metadata.at("type") == "backup");
        assert(coordinator.monitor().is_watching("U"));
        assert(coordinator.active_uploads() == std::vector<std::string>{"U"});

        const auto audit = coordinator.tracker().audit_entries("U");
        assert(audit.size() == 2);
        assert(audit[0].kind == "request");
        assert(audit[1].kind == "summary");
        coordinator.stop_all();
    }

    const std::size_t puts = store.calls("put_object");
    {
        UploadCoordinator restarted(options_for(work), store, logger);
        assert(restarted.tracker().get_incomplete_files("U").empty());
        assert(restarted.monitor().is_watching("U"));
    }
    assert(store.calls("put_object") == static_cast<int>(puts));
    std::cout << "✓ start uploads existing files" << std::endl;
}

void test_detected_changes_are_uploaded() {
    ScratchDir work("coordinator_changes");
    const auto source = work / "src";
    std::filesystem::create_directories(source);

    Logger logger;
    FakeObjectStore store;
    UploadCoordinator coordinator(options_for(work), store, logger);
    coordinator.start_upload(UploadRequest("U", source, "bucket"));
    assert(store.object_count() == 0);

    write_file(source / "late.txt", "late");
    assert(wait_until([&] {
        const auto state = coordinator.tracker().get_state("U");
        return state && state->is_completed((source / "late.txt").string());
    }));
    assert(store.object("bucket", "late.txt").data == "late");

    write_file(source / "late.txt", "changed");
    touch_later(source / "late.txt");
    assert(wait_until([&] { return store.object("bucket", "late.txt").data == "changed"; }));
    coordinator.stop_all();
    std::cout << "✓ detected changes are uploaded" << std::endl;
}

void test_failed_files_stay_incomplete() {
    ScratchDir work("coordinator_failures");
    const auto source = work / "src";
    write_file(source / "big.bin", 100);

    Logger logger;
    FakeObjectStore store;
    store.fail_next("upload_part", {"AccessDenied"});
    UploadCoordinator coordinator(options_for(work), store, logger);
    coordinator.start_upload(UploadRequest("U", source, "bucket"));

    const auto file = (source / "big.bin").string();
    const auto state = coordinator.tracker().get_state("U");
    assert(!state->is_completed(file));
    assert(state->in_progress_files.count(file) == 1);
    assert(store.aborted_sessions().size() == 1);
    assert(coordinator.tracker().get_incomplete_files("U").count(file) == 1);
    coordinator.stop_all();
    std::cout << "✓ failed files stay incomplete" << std::endl;
}

void test_resume_retries_incomplete_files() {
    ScratchDir work("coordinator_resume");
    const auto source = work / "src";
    write_file(source / "a.txt", "a");
    write_file(source / "b.txt", "b");

    Logger logger;
    {
        FakeObjectStore failing;
        failing.fail_next("put_object", {"AccessDenied", "AccessDenied"});
        UploadCoordinator coordinator(options_for(work), failing, logger);
        coordinator.start_upload(UploadRequest("U", source, "bucket"));
        assert(coordinator.tracker().get_state("U")->completed_files.empty());
        coordinator.stop_all();
    }

    FakeObjectStore healthy;
    UploadCoordinator resumed(options_for(work), healthy, logger);
    const auto state = resumed.tracker().get_state("U");
    assert(state->completed_files.size() == 2);
    assert(healthy.has_object("bucket", "a.txt"));
    assert(healthy.has_object("bucket", "b.txt"));
    resumed.stop_all();
    std::cout << "✓ resume retries incomplete files" << std::endl;
}

void test_stop_upload_keeps_state() {
    ScratchDir work("coordinator_stop");
    const auto source = work / "src";
    write_file(source / "a.txt", "a");

    Logger logger;
    FakeObjectStore store;
    UploadCoordinator coordinator(options_for(work), store, logger);
    coordinator.start_upload(UploadRequest("U", source, "bucket"));
    coordinator.stop_upload("U");
    assert(!coordinator.monitor().is_watching("U"));
    assert(coordinator.active_uploads().empty());
    assert(coordinator.tracker().get_state("U"));

    write_file(source / "after.txt", "x");
    std::this_thread::sleep_for(300ms);
    assert(!store.has_object("bucket", "after.txt"));
    std::cout << "✓ stop_upload keeps state" << std::endl;
}

void test_shutdown_waits_for_running_upload() {
    ScratchDir work("coordinator_shutdown");
    const auto source = work / "src";
    std::filesystem::create_directories(source);
    const auto file = (source / "slow.txt").string();

    Logger logger;
    SlowStore store;
    {
        auto options = options_for(work);
        options.monitor_stop_timeout = 50ms;
        UploadCoordinator coordinator(options, store, logger);
        coordinator.start_upload(UploadRequest("U", source, "bucket"));
        write_file(source / "slow.txt", "slow");
        assert(wait_until([&] { return store.put_started(); }));
    }
    assert(store.has_object("bucket", "slow.txt"));

    UploadTracker reloaded(TrackerOptions{work / "state.json", ""}, logger);
    const auto state = reloaded.get_state("U");
    assert(state && state->is_completed(file));
    std::cout << "✓ shutdown waits for running upload" << std::endl;
}

void test_missing_source_rejected() {
    ScratchDir work("coordinator_missing");
    const auto source = work / "src";
    std::filesystem::create_directories(source);
    const UploadRequest request("U", source, "bucket");
    std::filesystem::remove_all(source);

    Logger logger;
    FakeObjectStore store;
    UploadCoordinator coordinator(options_for(work), store, logger);
    bool thrown = false;
    try {
        coordinator.start_upload(request);
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
    assert(!coordinator.tracker().get_state("U"));
    std::cout << "✓ missing source rejected" << std::endl;
}

void test_request_validation() {
    ScratchDir work("coordinator_validation");
    write_file(work / "file.txt", "x");
    const auto rejects = [](auto&& make) {
        try {
            make();
        } catch (const std::invalid_argument&) {
            return true;
        }
        return false;
    };
    assert(rejects([&] { UploadRequest("", work.path(), "bucket"); }));
    assert(rejects([&] { UploadRequest("U", work.path(), ""); }));
    assert(rejects([&] { UploadRequest("U", work / "absent", "bucket"); }));
    assert(rejects([&] { UploadRequest("U", work / "file.txt", "bucket"); }));
    assert(UploadRequest("U", work.path(), "bucket", "").pattern() == "*");
    std::cout << "✓ request validation" << std::endl;
}

int main() {
    test_start_uploads_existing_files();
    test_detected_changes_are_uploaded();
    test_failed_files_stay_incomplete();
    test_resume_retries_incomplete_files();
    test_stop_upload_keeps_state();
    test_shutdown_waits_for_running_upload();
    test_missing_source_rejected();
    test_request_validation();
    std::cout << "All coordinator tests passed" << std::endl;
    return 0;
}
