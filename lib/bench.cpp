/* Ringbench: message-passing micro-benchmarks
 * Copyright (C) Calum Grant 2012
 */

#include <ringbench/bench.hpp>

#include <iomanip>
#include <limits>
#include <ostream>
#include <sstream>
#include <stdexcept>

double ringbench::timer::elapsed() const
{
	std::chrono::duration<double> d = std::chrono::steady_clock::now() - m_start;
	return d.count();
}

void ringbench::timer::reset()
{
	m_start = std::chrono::steady_clock::now();
}

double ringbench::throughput(long long messages, double seconds)
{
	if( !(seconds>0) ) return std::numeric_limits<double>::quiet_NaN();
	return double(messages) / seconds;
}

std::ostream & ringbench::operator<<(std::ostream & os, const measurement & m)
{
	std::ostringstream line;
	line << std::fixed << std::setprecision(6) << m.name << ": " << m.throughput();
	switch( m.units )
	{
	case measurement::messages_per_second:
		line << " msgs/s - " << m.messages << "m/" << m.seconds << "s - " << m.result;
		break;
	case measurement::hops_per_second:
		line << " hops per second";
		break;
	}
	return os << line.str();
}

ringbench::test::~test()
{
}

void ringbench::test::release()
{
}

ringbench::scheduler & ringbench::test::get_scheduler()
{
	return default_scheduler;
}

ringbench::measurement ringbench::measure(test & t)
{
	timer clock;
	t.run();
	double duration = clock.elapsed();

	if( !t.validate() )
		throw std::runtime_error(std::string(t.name()) + ": validation failed with result " + t.result());

	measurement m;
	m.name = t.name();
	m.units = t.units();
	m.messages = t.messages();
	m.seconds = duration;
	m.result = t.result();
	return m;
}

void ringbench::quiesce(scheduler & sched, int rounds, int pause_ms)
{
	for( int i=0; i<rounds; ++i )
	{
		while( sched.run_one() )
			;
		pause(pause_ms);
	}
}

void ringbench::quiesce(test & t, int rounds, int pause_ms)
{
	t.release();
	quiesce(t.get_scheduler(), rounds, pause_ms);
}

ringbench::thread_ring_test::thread_ring_test(const thread_ring::variant & v, int nodes, int token, int chains, int threads) :
	m_variant(v), m_nodes(nodes), m_token(token), m_chains(chains), m_threads(threads), m_hops(0)
{
}

const char * ringbench::thread_ring_test::name() const
{
	return m_variant.name;
}

ringbench::measurement::units_type ringbench::thread_ring_test::units() const
{
	return measurement::messages_per_second;
}

// The rings stay alive after the run, so that tearing them down is not timed.
void ringbench::thread_ring_test::run()
{
	m_rings.reset(new thread_ring::parallel_run(m_variant, m_nodes, m_token, m_chains, m_scheduler));
	m_reporters = m_rings->run(m_threads);
	m_hops = m_rings->hops();
}

void ringbench::thread_ring_test::release()
{
	m_rings.reset();
}

long long ringbench::thread_ring_test::messages() const
{
	return (long long)m_chains * m_token;
}

bool ringbench::thread_ring_test::validate() const
{
	if( int(m_reporters.size()) != m_chains ) return false;
	if( m_hops != messages() ) return false;
	const int reporter = thread_ring::expected_reporter(m_nodes, m_token);
	for( std::size_t i=0; i<m_reporters.size(); ++i )
		if( m_reporters[i] != reporter ) return false;
	return true;
}

std::string ringbench::thread_ring_test::result() const
{
	std::ostringstream os;
	os << "[";
	for( std::size_t i=0; i<m_reporters.size(); ++i )
	{
		if( i ) os << "; ";
		os << m_reporters[i];
	}
	os << "]";
	return os.str();
}

ringbench::config::config() :
	threads(platform::thread::hardware_concurrency()),
	quiesce_rounds(10),
	quiesce_pause_ms(50)
{
	if( threads<1 ) threads=4;

	variants.push_back(&thread_ring::ch_give);
	variants.push_back(&thread_ring::mb_send);
	variants.push_back(&thread_ring::ch_send);
	variants.push_back(&thread_ring::mp_post);

	ring_case short_ring = { 503, 5000, 1 };
	ring_case long_ring = { 503, 50000000, 1 };
	ring_case parallel_rings = { 53, 50000000, threads };
	ring_cases.push_back(short_ring);
	ring_cases.push_back(long_ring);
	ring_cases.push_back(parallel_rings);

	for( int n=2000; n<=20000000; n*=10 )
		reader_writer_cases.push_back(n);
}

namespace
{
	void run_one(ringbench::test & t, const ringbench::config & cfg, std::ostream & out)
	{
		ringbench::measurement m = ringbench::measure(t);
		out << m << std::endl;
		ringbench::quiesce(t, cfg.quiesce_rounds, cfg.quiesce_pause_ms);
	}
}

void ringbench::run_benchmarks(const config & cfg, std::ostream & out)
{
	for( std::size_t v=0; v<cfg.variants.size(); ++v )
	{
		for( std::size_t c=0; c<cfg.ring_cases.size(); ++c )
		{
			const config::ring_case & rc = cfg.ring_cases[c];
			thread_ring_test t(*cfg.variants[v], rc.nodes, rc.token, rc.chains, cfg.threads);
			run_one(t, cfg, out);
		}
	}

	for( std::size_t i=0; i<cfg.reader_writer_cases.size(); ++i )
	{
		reader_writer_test<reader_writer::literal<> > t(cfg.reader_writer_cases[i], cfg.threads);
		run_one(t, cfg, out);
	}

	for( std::size_t i=0; i<cfg.reader_writer_cases.size(); ++i )
	{
		reader_writer_test<reader_writer::tweaked<> > t(cfg.reader_writer_cases[i], cfg.threads);
		run_one(t, cfg, out);
	}
}
