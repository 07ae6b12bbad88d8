#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include "core/engine/transfer_engine.hpp"
#include "test_utils.hpp"

using namespace fxfer::core;
using fxfer::infra::Config;
using fxfer::test::TempDir;

namespace {

// Опрашивает движок так же, как слой представления, до терминального события
std::vector<TransferEvent> poll_until_terminal(TransferEngine& engine, TransferHandle handle,
                                               std::chrono::seconds timeout = std::chrono::seconds(60)) {
    std::vector<TransferEvent> all;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        for (auto& e : engine.poll_events(handle)) {
            all.push_back(std::move(e));
        }
        if (!all.empty() && is_terminal(all.back())) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return all;
}

Config engine_config() {
    Config cfg;
    cfg.threads = 4;
    return cfg;
}

} // namespace

TEST(TransferEngineTest, RejectsUnspecifiedPaths)
{
    TransferEngine engine;
    auto no_source = engine.start_transfer("", "/tmp");
    ASSERT_FALSE(no_source.has_value());
    EXPECT_EQ(no_source.error().code, fxfer::infra::ErrorCode::InvalidArgument);

    auto no_destination = engine.start_transfer("/tmp", "");
    ASSERT_FALSE(no_destination.has_value());
    EXPECT_EQ(no_destination.error().code, fxfer::infra::ErrorCode::InvalidArgument);
}

TEST(TransferEngineTest, ScenarioTwoFilesEndsWithDone)
{
    TempDir dir;
    fxfer::test::write_file(dir / "S/a.txt", "0123456789");
    fxfer::test::write_file(dir / "S/sub/b.txt", "01234567890123456789");
    std::filesystem::create_directories(dir / "D");

    TransferEngine engine(engine_config());
    auto handle = engine.start_transfer(dir / "S", dir / "D");
    ASSERT_TRUE(handle.has_value());

    auto events = poll_until_terminal(engine, *handle);
    ASSERT_FALSE(events.empty());
    EXPECT_TRUE(std::holds_alternative<DoneEvent>(events.back()));

    EXPECT_EQ(fxfer::test::read_file(dir / "D/S/a.txt"), "0123456789");
    EXPECT_EQ(fxfer::test::read_file(dir / "D/S/sub/b.txt"), "01234567890123456789");

    auto summary = engine.wait(*handle);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->total_bytes, 30u);
    EXPECT_EQ(summary->copied_bytes, 30u);
    EXPECT_FALSE(engine.is_active(*handle));

    // После терминального события очередь пуста
    EXPECT_TRUE(engine.poll_events(*handle).empty());
}

TEST(TransferEngineTest, EmptyDirectoryReportsSingleError)
{
    TempDir dir;
    std::filesystem::create_directories(dir / "S");

    TransferEngine engine(engine_config());
    auto handle = engine.start_transfer(dir / "S", dir / "D");
    ASSERT_TRUE(handle.has_value());

    auto events = poll_until_terminal(engine, *handle);
    ASSERT_EQ(events.size(), 1u);
    const auto* err = std::get_if<ErrorEvent>(&events[0]);
    ASSERT_NE(err, nullptr);
    EXPECT_NE(err->message.find("empty"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(dir / "D"));
}

TEST(TransferEngineTest, MissingSourceReportedAsEventNotSynchronously)
{
    TempDir dir;
    TransferEngine engine(engine_config());
    auto handle = engine.start_transfer(dir / "missing", dir / "D");
    ASSERT_TRUE(handle.has_value());

    auto events = poll_until_terminal(engine, *handle);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<ErrorEvent>(events[0]));
}

TEST(TransferEngineTest, CancelOnLargeTreeStopsNewTasks)
{
    TempDir dir;
    for (int i = 0; i < 1000; ++i) {
        fxfer::test::write_file(dir / ("S/d" + std::to_string(i % 10) + "/f" + std::to_string(i)),
                                std::string(512, 'x'));
    }

    Config cfg;
    cfg.threads = 2;
    TransferEngine engine(cfg);
    auto handle = engine.start_transfer(dir / "S", dir / "D");
    ASSERT_TRUE(handle.has_value());
    engine.cancel(*handle);
    engine.cancel(*handle);

    auto events = poll_until_terminal(engine, *handle);
    ASSERT_FALSE(events.empty());
    EXPECT_TRUE(std::holds_alternative<CancelledEvent>(events.back()));
    std::size_t terminals = 0;
    for (const auto& e : events) terminals += is_terminal(e) ? 1 : 0;
    EXPECT_EQ(terminals, 1u);

    auto summary = engine.wait(*handle);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->phase, TransferPhase::Cancelled);
    EXPECT_LE(summary->copied_bytes, summary->total_bytes);
    EXPECT_EQ(summary->files_copied + summary->files_dropped, 1000u);
    // Скопированные до отмены файлы остаются на месте и целые
    EXPECT_EQ(fxfer::test::count_files(dir / "D/S"), summary->files_copied);
    EXPECT_EQ(summary->copied_bytes, summary->files_copied * 512u);
}

TEST(TransferEngineTest, CancelIsIdempotentAndSafeForUnknownHandles)
{
    TempDir dir;
    fxfer::test::write_file(dir / "f", "x");

    TransferEngine engine(engine_config());
    engine.cancel(12345);
    EXPECT_TRUE(engine.poll_events(12345).empty());
    EXPECT_FALSE(engine.is_active(12345));
    EXPECT_FALSE(engine.wait(12345).has_value());

    auto handle = engine.start_transfer(dir / "f", dir / "D");
    ASSERT_TRUE(handle.has_value());
    auto events = poll_until_terminal(engine, *handle);
    ASSERT_FALSE(events.empty());

    // Передача завершена: отмена ничего не меняет
    engine.cancel(*handle);
    engine.cancel(*handle);
    EXPECT_TRUE(engine.poll_events(*handle).empty());
    EXPECT_EQ(engine.wait(*handle)->phase, TransferPhase::Completed);
}

TEST(TransferEngineTest, SingleFileProgressThenDone)
{
    TempDir dir;
    fxfer::test::write_file(dir / "one.bin", fxfer::test::make_payload(1500));

    TransferEngine engine(engine_config());
    auto handle = engine.start_transfer(dir / "one.bin", dir / "D");
    ASSERT_TRUE(handle.has_value());

    auto events = poll_until_terminal(engine, *handle);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(std::get<ProgressEvent>(events[0]).percent, 100u);
    EXPECT_TRUE(std::holds_alternative<DoneEvent>(events[1]));
    EXPECT_EQ(engine.wait(*handle)->pool_size, 0u);
}

TEST(TransferEngineTest, IndependentTransfersRunConcurrently)
{
    TempDir dir;
    fxfer::test::write_file(dir / "A/x", "aaa");
    fxfer::test::write_file(dir / "B/y", "bbb");

    TransferEngine engine(engine_config());
    auto first = engine.start_transfer(dir / "A", dir / "D");
    auto second = engine.start_transfer(dir / "B", dir / "D");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(*first, *second);

    EXPECT_TRUE(std::holds_alternative<DoneEvent>(poll_until_terminal(engine, *first).back()));
    EXPECT_TRUE(std::holds_alternative<DoneEvent>(poll_until_terminal(engine, *second).back()));
    EXPECT_EQ(fxfer::test::read_file(dir / "D/A/x"), "aaa");
    EXPECT_EQ(fxfer::test::read_file(dir / "D/B/y"), "bbb");
}

TEST(TransferEngineTest, ReleaseForgetsTransfer)
{
    TempDir dir;
    fxfer::test::write_file(dir / "f", "x");

    TransferEngine engine(engine_config());
    auto handle = engine.start_transfer(dir / "f", dir / "D");
    ASSERT_TRUE(handle.has_value());
    engine.release(*handle);

    EXPECT_FALSE(engine.wait(*handle).has_value());
    EXPECT_TRUE(engine.poll_events(*handle).empty());
    // Передача дорабатывает до конца даже после release
    EXPECT_EQ(fxfer::test::read_file(dir / "D/f"), "x");
}

TEST(TransferEngineTest, DestructorWaitsForRunningTransfers)
{
    TempDir dir;
    for (int i = 0; i < 100; ++i) {
        fxfer::test::write_file(dir / ("S/f" + std::to_string(i)), "data");
    }
    {
        TransferEngine engine(engine_config());
        ASSERT_TRUE(engine.start_transfer(dir / "S", dir / "D").has_value());
    }
    // Деструктор отменил и дождался: частичных файлов нет
    if (!std::filesystem::exists(dir / "D")) return;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(dir / "D")) {
        if (entry.is_regular_file()) {
            EXPECT_EQ(fxfer::test::read_file(entry.path()), "data");
        }
    }
}
