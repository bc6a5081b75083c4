/* Ringbench: message-passing micro-benchmarks
 * Copyright (C) Calum Grant 2012
 */

#ifndef RINGBENCH_BENCH_INCLUDED
#define RINGBENCH_BENCH_INCLUDED

#include "thread_ring.hpp"
#include "reader_writer.hpp"

#include <chrono>
#include <iosfwd>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace ringbench
{
	// Wall-clock stopwatch.
	class timer
	{
	public:
		timer() { reset(); }

		// Seconds since construction or the last reset().
		double elapsed() const;

		void reset();

	private:
		std::chrono::steady_clock::time_point m_start;
	};

	// Messages per second, or NaN if no time has elapsed.
	double throughput(long long messages, double seconds);

	// The outcome of one timed run.
	struct measurement
	{
		enum units_type { messages_per_second, hops_per_second };

		std::string name;
		units_type units;
		long long messages;
		double seconds;
		std::string result;

		double throughput() const { return ringbench::throughput(messages, seconds); }
	};

	// Formats the result line, e.g.
	// "ChGive: 4012.500000 msgs/s - 5000m/1.246106s - [474]" or
	// "Literal: 1000000.000000 hops per second".
	std::ostream & operator<<(std::ostream & os, const measurement & m);

	// A benchmark which can be timed and checked.
	struct test
	{
		virtual ~test();
		virtual const char * name() const=0;
		virtual measurement::units_type units() const=0;
		virtual void run()=0;
		virtual long long messages() const=0;
		virtual bool validate() const=0;
		virtual std::string result() const=0;

		// Frees what the last run left behind. Not timed.
		virtual void release();

		// The scheduler the test runs on.
		virtual scheduler & get_scheduler();
	};

	// Times one complete run of t.
	// Throws std::runtime_error if the run does not validate.
	measurement measure(test & t);

	// Pause between runs, so that what one run leaves behind does not
	// disturb the next: drain the scheduler and sleep, rounds times.
	void quiesce(scheduler & sched = default_scheduler, int rounds=10, int pause_ms=50);

	// Releases the state of t's last run, then quiesces its scheduler.
	void quiesce(test & t, int rounds=10, int pause_ms=50);

	// P rings of N actors, each given the token M.
	class thread_ring_test : public test
	{
	public:
		thread_ring_test(const thread_ring::variant & v, int nodes, int token, int chains, int threads);

		const char * name() const;
		measurement::units_type units() const;
		void run();
		long long messages() const;
		bool validate() const;
		std::string result() const;
		void release();
		scheduler & get_scheduler() { return m_scheduler; }

		const std::vector<int> & reporters() const { return m_reporters; }

		// Whether the rings of the last run are still held.
		bool retained() const { return m_rings!=nullptr; }

	private:
		const thread_ring::variant m_variant;
		const int m_nodes, m_token, m_chains, m_threads;
		scheduler m_scheduler;
		std::unique_ptr<thread_ring::parallel_run> m_rings;
		std::vector<int> m_reporters;
		long long m_hops;
	};

	// One writer and one reader exchanging n values.
	template<typename Strategy>
	class reader_writer_test : public test
	{
	public:
		reader_writer_test(int n, int threads) : m_n(n), m_threads(threads), m_sum(-1) { }

		const char * name() const { return Strategy::name(); }
		measurement::units_type units() const { return measurement::hops_per_second; }
		void run() { m_sum = Strategy::run(m_n, m_threads, m_scheduler); }
		scheduler & get_scheduler() { return m_scheduler; }
		long long messages() const { return m_n; }
		bool validate() const { return m_sum == reader_writer::expected_sum(m_n); }

		std::string result() const
		{
			std::ostringstream os;
			os << m_sum;
			return os.str();
		}

		long long sum() const { return m_sum; }

	private:
		const int m_n, m_threads;
		scheduler m_scheduler;
		long long m_sum;
	};

	/*	The benchmark matrix. Nothing is read from the command line; the
		processor count sizes the worker pool and the widest ring run.
	  */
	struct config
	{
		struct ring_case
		{
			int nodes;
			int token;
			int chains;
		};

		config();

		int threads;
		int quiesce_rounds;
		int quiesce_pause_ms;
		std::vector<const thread_ring::variant*> variants;
		std::vector<ring_case> ring_cases;
		std::vector<int> reader_writer_cases;
	};

	// Runs every configuration and writes one line per run to out.
	void run_benchmarks(const config & cfg, std::ostream & out);
}

#endif
