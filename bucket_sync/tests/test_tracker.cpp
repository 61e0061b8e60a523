#include "file_scanner.hpp"
#include "logger.hpp"
#include "models.hpp"
#include "test_support.hpp"
#include "upload_tracker.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cassert>
#include <fstream>
#include <iostream>

using namespace bucket_sync::agent;
using bucket_sync::test::ScratchDir;
using bucket_sync::test::touch_later;
using bucket_sync::test::write_file;

namespace {

UploadResult success_for(const std::filesystem::path& file) {
    UploadResult result;
    result.file_path = file;
    result.key = file.filename().string();
    result.success = true;
    result.etag = "etag";
    return result;
}

bool disjoint(const UploadState& state) {
    return std::none_of(state.completed_files.begin(), state.completed_files.end(),
                        [&](const std::string& path) { return state.in_progress_files.count(path) != 0; });
}

}  // namespace

void test_register_persists_state() {
    ScratchDir work("tracker_register");
    const auto source = work / "src";
    std::filesystem::create_directories(source);
    const auto state_file = work / "state.json";

    Logger logger;
    UploadTracker tracker(TrackerOptions{state_file, {}}, logger);
    tracker.register_upload(UploadRequest("u1", source, "bucket", "*.txt"));

    const auto state = tracker.get_state("u1");
    assert(state);
    assert(state->source_folder == source.string());
    assert(state->destination_bucket == "bucket");
    assert(state->pattern == "*.txt");
    assert(state->completed_files.empty());
    assert(!tracker.get_state("missing"));

    std::ifstream in(state_file);
    const auto document = nlohmann::json::parse(in);
    assert(document.at("upload_states").size() == 1);
    assert(document["upload_states"][0]["upload_id"] == "u1");
    assert(document["upload_states"][0]["in_progress_files"].is_object());
    std::cout << "✓ register persists state" << std::endl;
}

void test_mark_complete_is_idempotent() {
    ScratchDir work("tracker_idempotent");
    const auto source = work / "src";
    write_file(source / "a.txt", "a");

    Logger logger;
    UploadTracker tracker(TrackerOptions{work / "state.json", {}}, logger);
    tracker.register_upload(UploadRequest("u1", source, "bucket"));

    const auto file = (source / "a.txt").string();
    tracker.mark_complete("u1", file, success_for(source / "a.txt"));
    tracker.mark_complete("u1", file, success_for(source / "a.txt"));

    const auto state = tracker.get_state("u1");
    assert(std::count(state->completed_files.begin(), state->completed_files.end(), file) == 1);
    assert(state->last_modified_times.at(file) == modification_time(file));

    UploadResult failure = success_for(source / "b.txt");
    failure.success = false;
    tracker.mark_complete("u1", (source / "b.txt").string(), failure);
    assert(tracker.get_state("u1")->completed_files.size() == 1);
    std::cout << "✓ mark_complete idempotent" << std::endl;
}

void test_chunked_session_then_complete() {
    ScratchDir work("tracker_chunked");
    const auto source = work / "src";
    write_file(source / "big.bin", 64);

    Logger logger;
    UploadTracker tracker(TrackerOptions{work / "state.json", {}}, logger);
    tracker.register_upload(UploadRequest("u1", source, "bucket"));

    const auto file = (source / "big.bin").string();
    tracker.register_chunked_session("u1", file, "session-1", 0, 0);
    tracker.register_chunked_session("u1", file, "session-1", 2, 32);
    auto state = tracker.get_state("u1");
    assert((state->in_progress_files.at(file) == ChunkedSession{"session-1", 2, 32}));
    assert(disjoint(*state));

    tracker.mark_complete("u1", file, success_for(source / "big.bin"));
    state = tracker.get_state("u1");
    assert(state->in_progress_files.empty());
    assert(state->is_completed(file));

    // Re-sending a completed file moves it back to in-progress only.
    tracker.register_chunked_session("u1", file, "session-2", 0, 0);
    state = tracker.get_state("u1");
    assert(!state->is_completed(file));
    assert(disjoint(*state));
    std::cout << "✓ chunked session bookkeeping" << std::endl;
}

void test_state_round_trip() {
    ScratchDir work("tracker_round_trip");
    const auto source = work / "src";
    write_file(source / "a.txt", "a");
    write_file(source / "b.bin", "b");
    const auto state_file = work / "state.json";

    Logger logger;
    UploadState before;
    {
        UploadTracker tracker(TrackerOptions{state_file, {}}, logger);
        tracker.register_upload(UploadRequest("u1", source, "bucket"));
        tracker.mark_complete("u1", (source / "a.txt").string(), success_for(source / "a.txt"));
        tracker.register_chunked_session("u1", (source / "b.bin").string(), "s-9", 3, 300);
        before = *tracker.get_state("u1");
    }

    UploadTracker reloaded(TrackerOptions{state_file, {}}, logger);
    const auto after = reloaded.get_state("u1");
    assert(after);
    assert(after->completed_files == before.completed_files);
    assert(after->in_progress_files == before.in_progress_files);
    assert(after->last_modified_times == before.last_modified_times);
    assert(after->pattern == before.pattern);
    std::cout << "✓ state round trip" << std::endl;
}

void test_corrupt_state_file_is_empty_state() {
    ScratchDir work("tracker_corrupt");
    const auto state_file = work / "state.json";
    write_file(state_file, "{\"upload_states\": [ {\"upload_id\": ");

    Logger logger;
    UploadTracker tracker(TrackerOptions{state_file, {}}, logger);
    assert(tracker.upload_ids().empty());

    write_file(state_file, "[1, 2, 3]");
    UploadTracker wrong_shape(TrackerOptions{state_file, {}}, logger);
    assert(wrong_shape.upload_ids().empty());
    std::cout << "✓ corrupt state file tolerated" << std::endl;
}

void test_incomplete_files() {
    ScratchDir work("tracker_incomplete");
    const auto source = work / "src";
    write_file(source / "done.txt", "done");

    Logger logger;
    UploadTracker tracker(TrackerOptions{work / "state.json", {}}, logger);
    tracker.register_upload(UploadRequest("u1", source, "bucket"));
    const auto done = (source / "done.txt").string();
    tracker.mark_complete("u1", done, success_for(source / "done.txt"));

    write_file(source / "new.txt", "new");
    auto incomplete = tracker.get_incomplete_files("u1");
    assert(incomplete.size() == 1);
    assert(incomplete.count((source / "new.txt").string()) == 1);

    touch_later(source / "done.txt");
    incomplete = tracker.get_incomplete_files("u1");
    assert(incomplete.size() == 2);
    assert(incomplete.count(done) == 1);

    tracker.register_chunked_session("u1", (source / "gone.bin").string(), "s-1", 1, 10);
    incomplete = tracker.get_incomplete_files("u1");
    assert(incomplete.count((source / "gone.bin").string()) == 1);

    assert(tracker.get_incomplete_files("unknown").empty());
    std::cout << "✓ incomplete files" << std::endl;
}

void test_restart_after_full_scan_has_nothing_pending() {
    ScratchDir work("tracker_restart");
    const auto source = work / "src";
    write_file(source / "x.txt", "x");
    const auto state_file = work / "state.json";

    Logger logger;
    {
        UploadTracker tracker(TrackerOptions{state_file, {}}, logger);
        tracker.register_upload(UploadRequest("u1", source, "bucket"));
        tracker.mark_complete("u1", (source / "x.txt").string(), success_for(source / "x.txt"));
    }
    UploadTracker restarted(TrackerOptions{state_file, {}}, logger);
    assert(restarted.get_incomplete_files("u1").empty());
    std::cout << "✓ restart leaves nothing pending" << std::endl;
}

void test_audit_records() {
    ScratchDir work("tracker_audit");
    const auto source = work / "src";
    write_file(source / "a.txt", "a");

    Logger logger;
    UploadTracker tracker(TrackerOptions{work / "state.json", work / "logs"}, logger);
    RequestMetadata metadata;
    metadata.name = "nightly";
    tracker.register_upload(UploadRequest("u1", source, "bucket", "*", metadata));

    UploadSummary summary;
    summary.upload_id = "u1";
    summary.total_files = 1;
    summary.successful_uploads = 1;
    summary.results.push_back(success_for(source / "a.txt"));
    tracker.log_upload_summary(summary);
    tracker.log_upload_request(UploadRequest("u1", source, "bucket"));

    const auto entries = tracker.audit_entries("u1");
    assert(entries.size() == 3);
    assert(entries[0].kind == "request");
    assert(entries[1].kind == "summary");
    assert(entries[2].kind == "request");
    assert(entries[0].log_key.rfind("upload_u1_", 0) == 0);

    const auto request_doc = nlohmann::json::parse(entries[0].document);
    assert(request_doc["metadata"]["name"] == "nightly");
    assert(request_doc["metadata"]["type"].is_null());

    const auto summary_doc = nlohmann::json::parse(entries[1].document);
    assert(summary_doc["successful_uploads"] == 1);
    assert(summary_doc["results"][0]["s3_key"] == "a.txt");
    assert(std::filesystem::exists(work / "logs" / "audit.db"));
    assert(tracker.audit_entries("other").empty());
    std::cout << "✓ audit records" << std::endl;
}

void test_reupload_refreshes_modification_time() {
    ScratchDir work("tracker_reupload");
    const auto source = work / "src";
    write_file(source / "x.txt", "x");
    const auto state_file = work / "state.json";
    const auto file = (source / "x.txt").string();

    Logger logger;
    {
        UploadTracker tracker(TrackerOptions{state_file, {}}, logger);
        tracker.register_upload(UploadRequest("u1", source, "bucket"));
        tracker.mark_complete("u1", file, success_for(source / "x.txt"));

        touch_later(source / "x.txt");
        assert(tracker.get_incomplete_files("u1").count(file) == 1);
        tracker.mark_complete("u1", file, success_for(source / "x.txt"));
        assert(tracker.get_state("u1")->last_modified_times.at(file) == modification_time(file));
    }
    UploadTracker restarted(TrackerOptions{state_file, {}}, logger);
    assert(restarted.get_incomplete_files("u1").empty());
    std::cout << "✓ re-upload refreshes modification time" << std::endl;
}

int main() {
    test_register_persists_state();
    test_mark_complete_is_idempotent();
    test_chunked_session_then_complete();
    test_state_round_trip();
    test_corrupt_state_file_is_empty_state();
    test_incomplete_files();
    test_restart_after_full_scan_has_nothing_pending();
    test_reupload_refreshes_modification_time();
    test_audit_records();
    std::cout << "All tracker tests passed" << std::endl;
    return 0;
}
