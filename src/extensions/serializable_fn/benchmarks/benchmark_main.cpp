#define ANKERL_NANOBENCH_IMPLEMENT
#include <nanobench.h>
#include <chrono>
#include <freezer_tracing/tracing.h>

void benchmark_freeze();

int main()
{
  (void)freezer::wait_for_tracer(std::chrono::milliseconds{2000});
  benchmark_freeze();
  freezer::shutdown_tracer();
}
