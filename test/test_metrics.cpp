#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <thread>
#include <vector>

#include <vgreeks/metrics.hpp>

using Catch::Approx;

namespace {

vgreeks::BatchMetricsRecord make_record(vgreeks::ComputationPath path, std::size_t contracts, double elapsed_ms) {
    vgreeks::BatchMetricsRecord record;
    record.path = path;
    record.total_contracts = contracts;
    record.elapsed_ms = elapsed_ms;
    return record;
}

} // namespace

TEST_CASE("Speedup is only defined for batch records with a comparison") {
    auto record = make_record(vgreeks::ComputationPath::Batch, 100, 2.0);
    REQUIRE_FALSE(record.speedup().has_value());

    record.scalar_elapsed_ms = 10.0;
    REQUIRE(record.speedup().value() == Approx(5.0));
    REQUIRE(record.contracts_per_second() == Approx(50000.0));

    record.path = vgreeks::ComputationPath::Scalar;
    REQUIRE_FALSE(record.speedup().has_value());
}

TEST_CASE("Tracker aggregates calls, contracts and mean timings") {
    vgreeks::PerformanceMetricsTracker tracker;

    tracker.record(make_record(vgreeks::ComputationPath::Batch, 500, 2.0));
    tracker.record(make_record(vgreeks::ComputationPath::Batch, 1000, 4.0));
    tracker.record(make_record(vgreeks::ComputationPath::Scalar, 5, 1.0));

    auto fallback = make_record(vgreeks::ComputationPath::Scalar, 50, 3.0);
    fallback.fell_back = true;
    tracker.record(fallback);

    const auto snapshot = tracker.snapshot();
    REQUIRE(snapshot.batch_calls == 2);
    REQUIRE(snapshot.scalar_calls == 2);
    REQUIRE(snapshot.fallback_calls == 1);
    REQUIRE(snapshot.total_calls() == 4);
    REQUIRE(snapshot.total_contracts == 1555);
    REQUIRE(snapshot.total_elapsed_ms == Approx(10.0));
    REQUIRE(snapshot.contracts_per_second == Approx(155500.0));
    REQUIRE(snapshot.avg_batch_ms == Approx(3.0));
    REQUIRE(snapshot.avg_scalar_ms == Approx(2.0));
    REQUIRE(snapshot.speedup_samples == 0);
}

TEST_CASE("Tracker keeps last and mean speedup") {
    vgreeks::PerformanceMetricsTracker tracker;

    auto first = make_record(vgreeks::ComputationPath::Batch, 100, 1.0);
    first.scalar_elapsed_ms = 4.0;
    auto second = make_record(vgreeks::ComputationPath::Batch, 100, 1.0);
    second.scalar_elapsed_ms = 8.0;
    tracker.record(first);
    tracker.record(second);

    const auto snapshot = tracker.snapshot();
    REQUIRE(snapshot.speedup_samples == 2);
    REQUIRE(snapshot.last_speedup == Approx(8.0));
    REQUIRE(snapshot.mean_speedup == Approx(6.0));
}

TEST_CASE("Tracker reset clears everything") {
    vgreeks::PerformanceMetricsTracker tracker;
    tracker.record(make_record(vgreeks::ComputationPath::Batch, 10, 1.0));
    tracker.reset();

    const auto snapshot = tracker.snapshot();
    REQUIRE(snapshot.total_calls() == 0);
    REQUIRE(snapshot.total_contracts == 0);
    REQUIRE(snapshot.avg_batch_ms == Approx(0.0));
    REQUIRE(snapshot.contracts_per_second == Approx(0.0));
}

TEST_CASE("Throughput is zero when no time was measured") {
    const auto record = make_record(vgreeks::ComputationPath::Scalar, 10, 0.0);
    REQUIRE(record.contracts_per_second() == Approx(0.0));
}

TEST_CASE("Tracker accepts concurrent records") {
    vgreeks::PerformanceMetricsTracker tracker;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&tracker] {
            for (int i = 0; i < 250; ++i) {
                tracker.record(make_record(vgreeks::ComputationPath::Batch, 2, 1.0));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    const auto snapshot = tracker.snapshot();
    REQUIRE(snapshot.batch_calls == 1000);
    REQUIRE(snapshot.total_contracts == 2000);
    REQUIRE(snapshot.avg_batch_ms == Approx(1.0));
}
