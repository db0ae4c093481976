#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <streambuf>
#include <string>
#include <vector>

namespace audit_gate::cli {

std::string format_bytes(uint64_t bytes);

uint64_t estimate_total_file_bytes(const std::vector<std::filesystem::path> &paths);

// Worker count for task_count jobs, bounded by the configured count and the
// hardware concurrency.
int compute_worker_count(int configured, size_t task_count);

class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b);

protected:
  int overflow(int c) override;
  int sync() override;

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

} // namespace audit_gate::cli
