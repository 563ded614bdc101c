#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <string>

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace swiftfs {

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        double secs = std::chrono::duration<double>(elapsed).count();
        histogram_.Observe(secs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Driver metrics backed by a prometheus::Registry.
///
/// The registry is serialized on demand with write_file() (atomic
/// temp+rename) for the node_exporter textfile collector.
class DriverMetrics {
public:
    /// @param labels  Constant labels applied to all metrics.
    explicit DriverMetrics(const std::map<std::string, std::string>& labels = {});

    DriverMetrics(const DriverMetrics&) = delete;
    DriverMetrics& operator=(const DriverMetrics&) = delete;

    /// Count one completed driver operation ("write_stream", "remove", ...).
    void record_operation(const std::string& operation, bool success);

    /// Duration histogram for one operation name.
    prometheus::Histogram& operation_duration(const std::string& operation);

    prometheus::Counter& bytes_written() { return *bytes_written_; }
    prometheus::Counter& bytes_read() { return *bytes_read_; }
    prometheus::Counter& segments_written() { return *segments_written_; }
    prometheus::Counter& padding_segments() { return *padding_segments_; }
    prometheus::Counter& tail_reads() { return *tail_reads_; }
    prometheus::Counter& objects_deleted() { return *objects_deleted_; }
    prometheus::Counter& bulk_deletes() { return *bulk_deletes_; }

    /// Current registry in Prometheus text format.
    std::string serialize() const;

    /// Write the registry to path. Returns false on I/O failure.
    bool write_file(const std::filesystem::path& path) const;

private:
    std::shared_ptr<prometheus::Registry> registry_;

    prometheus::Family<prometheus::Counter>* operations_family_;
    prometheus::Family<prometheus::Histogram>* duration_family_;

    prometheus::Counter* bytes_written_;
    prometheus::Counter* bytes_read_;
    prometheus::Counter* segments_written_;
    prometheus::Counter* padding_segments_;
    prometheus::Counter* tail_reads_;
    prometheus::Counter* objects_deleted_;
    prometheus::Counter* bulk_deletes_;
};

}  // namespace swiftfs
