#include "swiftfs/metrics.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace swiftfs {

DriverMetrics::DriverMetrics(const std::map<std::string, std::string>& labels)
    : registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    operations_family_ = &prometheus::BuildCounter()
        .Name("swiftfs_operations_total")
        .Help("Total driver operations by name and result")
        .Labels(labels)
        .Register(*registry_);

    bytes_written_ = &prometheus::BuildCounter()
        .Name("swiftfs_bytes_written_total")
        .Help("Caller bytes committed by write_stream and put_content")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    bytes_read_ = &prometheus::BuildCounter()
        .Name("swiftfs_bytes_read_total")
        .Help("Bytes returned by get_content and read_stream")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& segments_family = prometheus::BuildCounter()
        .Name("swiftfs_segments_written_total")
        .Help("Segment objects written")
        .Labels(labels)
        .Register(*registry_);
    segments_written_ = &segments_family.Add({{"kind", "data"}});
    padding_segments_ = &segments_family.Add({{"kind", "padding"}});

    tail_reads_ = &prometheus::BuildCounter()
        .Name("swiftfs_tail_reads_total")
        .Help("Ranged reads that preserved bytes past a partial overwrite")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& deletes_family = prometheus::BuildCounter()
        .Name("swiftfs_deletes_total")
        .Help("Objects removed by recursive delete")
        .Labels(labels)
        .Register(*registry_);
    objects_deleted_ = &deletes_family.Add({{"mode", "object"}});
    bulk_deletes_ = &deletes_family.Add({{"mode", "bulk"}});

    // --- Histograms ---

    duration_family_ = &prometheus::BuildHistogram()
        .Name("swiftfs_operation_duration_seconds")
        .Help("Driver operation duration")
        .Labels(labels)
        .Register(*registry_);
}

void DriverMetrics::record_operation(const std::string& operation, bool success) {
    operations_family_->Add({{"operation", operation},
                             {"result", success ? "success" : "failure"}}).Increment();
}

prometheus::Histogram& DriverMetrics::operation_duration(const std::string& operation) {
    return duration_family_->Add({{"operation", operation}},
        prometheus::Histogram::BucketBoundaries{
            0.005, 0.01, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0, 30.0, 60.0, 300.0});
}

std::string DriverMetrics::serialize() const {
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

bool DriverMetrics::write_file(const std::filesystem::path& path) const {
    auto tmp_path = path;
    tmp_path += ".tmp";

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) return false;
    ofs << serialize();
    ofs.close();
    if (!ofs.good()) return false;

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    return !ec;
}

}  // namespace swiftfs
