// prometheus_exporter.h - minimal Prometheus text exporter
#pragma once

#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace cqr::metrics {

using Labels = std::vector<std::pair<std::string, std::string>>;

class PrometheusExporter {
  public:
    void set_gauge(const std::string& name, double value, const std::string& help = "");
    void inc_counter(const std::string& name, double delta = 1.0, const std::string& help = "",
                     const Labels& labels = {});
    // Summary without quantiles: accumulates <name>_sum and <name>_count.
    void observe(const std::string& name, double value, const std::string& help = "",
                 const Labels& labels = {});

    // Current value of a counter or gauge series; 0 when absent.
    double value(const std::string& name, const Labels& labels = {}) const;

    std::string render() const;

  private:
    struct Series {
        std::string labels;  // rendered "{k="v",...}" or empty
        double value{0.0};   // gauge/counter value, or summary sum
        double count{0.0};   // summary observations
    };
    struct Family {
        std::string name;
        std::string help;
        std::string type;
        std::vector<Series> series;
    };

    Series& series_locked(const std::string& name, const char* type, const std::string& help,
                          const Labels& labels);

    mutable std::mutex mu_;
    std::vector<Family> families_;
};

}  // namespace cqr::metrics
