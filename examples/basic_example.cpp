// File: examples/basic_example.cpp
//
// Basic geospatial and time-series indexing example.
// Demonstrates:
// - Creating an IndexCoordinator from an EngineConfig
// - Inserting features and sensor readings
// - Bounding-box and time-range queries with aggregation
// - Subscribing to change events
// - Viewing statistics

#include "config/engine_config.hpp"
#include "core/index_coordinator.hpp"
#include <iostream>
#include <iomanip>

using namespace geochron;

void PrintResult(const std::string& label, const QueryResult& result) {
    std::cout << "  " << label << " [" << ToString(result.origin) << "]: "
              << result.records.size() << " record(s)\n";
    for (const auto& record : result.records) {
        std::cout << "    - " << record.id << " " << record.bbox.ToString() << "\n";
    }
}

int main(int argc, char** argv) {
    std::cout << "=== geochron Basic Indexing Example ===\n\n";

    // Step 1: Load configuration
    std::cout << "Step 1: Loading configuration...\n";

    EngineConfig config = EngineConfig::Default();
    if (argc > 1) {
        auto loaded = EngineConfig::LoadFromFile(argv[1]);
        if (!loaded) {
            std::cerr << "Could not load configuration from " << argv[1] << "\n";
            return 1;
        }
        config = *loaded;
    }
    config.logging.level = "warn";

    std::unique_ptr<IndexCoordinator> coordinator;
    try {
        coordinator = CreateCoordinator(config);
    } catch (const std::exception& e) {
        std::cerr << "Failed to create coordinator: " << e.what() << "\n";
        return 1;
    }
    std::cout << "  Journal backend: " << config.journal.backend << "\n\n";

    // Step 2: Subscribe to sensor events
    std::cout << "Step 2: Subscribing to sensor_001...\n";

    SubscriptionFilter filter;
    filter.series_id = "sensor_001";
    coordinator->Subscribe("sensors", filter, [](const ChangeEvent& event) {
        std::cout << "  event #" << event.sequence << ": " << ToString(event.change)
                  << " " << event.record_id << " = " << event.value.value_or(0.0) << "\n";
    });
    std::cout << "\n";

    // Step 3: Insert features
    std::cout << "Step 3: Inserting features...\n";

    coordinator->InsertFeature(Record::MakeFeature(
        "cities", "nyc", Geometry::Point(-74.006, 40.7128), {{"name", "New York"}}));
    coordinator->InsertFeature(Record::MakeFeature(
        "cities", "sf", Geometry::Point(-122.4194, 37.7749), {{"name", "San Francisco"}}));
    coordinator->InsertFeature(Record::MakeFeature(
        "cities", "lower_manhattan",
        Geometry::Polygon({{-74.1, 40.6}, {-73.9, 40.6}, {-73.9, 40.8}, {-74.1, 40.8}, {-74.1, 40.6}})));
    std::cout << "  Inserted 3 features\n\n";

    // Step 4: Insert sensor readings
    std::cout << "Step 4: Inserting sensor readings...\n";

    const Timestamp base = 1700000000;
    for (int minute = 1; minute <= 5; ++minute) {
        coordinator->InsertPoint(Record::MakePoint(
            "sensors", "sensor_001", "r" + std::to_string(minute),
            base + minute * 60, 20.0 + minute, {{"unit", "C"}}));
    }
    coordinator->InsertPoint(Record::MakePoint("sensors", "sensor_002", "other", base, 99.0));
    std::cout << "\n";

    // Step 5: Query
    std::cout << "Step 5: Querying...\n";

    BoundingBox manhattan(-74.1, 40.6, -73.9, 40.8);
    PrintResult("bbox", coordinator->QueryBBox("cities", manhattan));
    PrintResult("bbox again", coordinator->QueryBBox("cities", manhattan));

    auto avg = coordinator->QueryTimeSeries("sensors", "sensor_001",
                                            base + 60, base + 300, Aggregation::AVG);
    std::cout << "  sensor_001 avg over " << avg.records.size() << " readings: "
              << std::fixed << std::setprecision(2) << avg.aggregate.value_or(0.0) << "\n\n";

    // Step 6: Statistics
    std::cout << "Step 6: Statistics\n";

    auto stats = coordinator->GetStatistics();
    std::cout << "  Writes: " << stats.writes << "\n";
    std::cout << "  Index queries: " << stats.index_queries << "\n";
    std::cout << "  Cache hits: " << stats.cache.hits << "\n";
    std::cout << "  Cache hit rate: " << stats.cache.hit_rate * 100.0f << "%\n";
    std::cout << "  Spatial entries: " << stats.spatial.total_entries << "\n";
    std::cout << "  Temporal points: " << stats.temporal.total_points << "\n";
    std::cout << "  Events delivered: " << stats.subscribers.delivered << "\n";

    return 0;
}
