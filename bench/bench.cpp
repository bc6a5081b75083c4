/* Ringbench: message-passing micro-benchmarks
 * Copyright (C) Calum Grant 2012
 */

/*  Benchmark suite for ringbench.
	Runs the thread ring for every variant, then the reader/writer pair,
	and prints one line per run.
  */

#include <ringbench/bench.hpp>

#include <cstdio>
#include <exception>
#include <iostream>

int main()
{
	try
	{
		ringbench::config cfg;
		ringbench::run_benchmarks(cfg, std::cout);
		return 0;
	}
	catch( std::exception & ex )
	{
		fprintf(stderr, "ringbench: %s\n", ex.what());
		return 1;
	}
}
