/* Ringbench: message-passing micro-benchmarks
 * Copyright (C) Calum Grant 2012
 */

#undef NDEBUG
#include <ringbench/bench.hpp>

#include <cassert>
#include <cmath>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace ringbench;

void test_throughput()
{
	assert( throughput(100, 2.0)==50.0 );
	assert( std::isnan(throughput(100, 0.0)) );
	assert( std::isnan(throughput(0, 0.0)) );
	assert( std::isnan(throughput(100, -1.0)) );
}

void test_timer()
{
	timer t;
	ringbench::pause(5);
	double e = t.elapsed();
	assert( e>0 );
	t.reset();
	assert( t.elapsed()<=e+1 );
}

void test_message_line()
{
	measurement m;
	m.name = "ChGive";
	m.units = measurement::messages_per_second;
	m.messages = 5000;
	m.seconds = 0.5;
	m.result = "[2]";

	std::ostringstream os;
	os << m;
	assert( os.str()=="ChGive: 10000.000000 msgs/s - 5000m/0.500000s - [2]" );
}

void test_hops_line()
{
	measurement m;
	m.name = "Literal";
	m.units = measurement::hops_per_second;
	m.messages = 2000;
	m.seconds = 0.25;

	std::ostringstream os;
	os << m;
	assert( os.str()=="Literal: 8000.000000 hops per second" );
}

void test_ring_measurement()
{
	thread_ring_test t(thread_ring::ch_send, 3, 7, 2, 2);
	measurement m = measure(t);
	assert( m.name=="ChSend" );
	assert( m.messages==14 );
	assert( m.result=="[2; 2]" );
	assert( t.reporters().size()==2 );
	assert( m.seconds>=0 );
}

void test_rings_outlive_measurement()
{
	thread_ring_test t(thread_ring::mb_send, 3, 7, 2, 2);
	assert( !t.retained() );
	measure(t);
	assert( t.retained() );
	quiesce(t, 1, 1);
	assert( !t.retained() );
	assert( t.reporters().size()==2 );
	assert( &t.get_scheduler()!=&default_scheduler );
}

void test_reader_writer_measurement()
{
	reader_writer_test<reader_writer::tweaked<> > t(5, 2);
	measurement m = measure(t);
	assert( m.name=="Tweaked" );
	assert( m.units==measurement::hops_per_second );
	assert( m.messages==5 );
	assert( m.result=="15" );
	assert( t.sum()==15 );
	assert( &t.get_scheduler()!=&default_scheduler );
}

// A test which always produces the wrong answer.
struct broken_test : public test
{
	const char * name() const { return "Broken"; }
	measurement::units_type units() const { return measurement::messages_per_second; }
	void run() { }
	long long messages() const { return 1; }
	bool validate() const { return false; }
	std::string result() const { return "[]"; }
};

void test_validation_failure()
{
	broken_test t;
	bool caught=false;
	try
	{
		measure(t);
	}
	catch( std::runtime_error & ex )
	{
		caught = std::string(ex.what()).find("Broken")==0;
	}
	assert( caught );
}

void test_config()
{
	config cfg;
	assert( cfg.threads>0 );
	assert( cfg.variants.size()==4 );
	assert( cfg.variants[0]==&thread_ring::ch_give );
	assert( cfg.variants[1]==&thread_ring::mb_send );
	assert( cfg.variants[2]==&thread_ring::ch_send );
	assert( cfg.variants[3]==&thread_ring::mp_post );
	assert( cfg.ring_cases.size()==3 );
	assert( cfg.ring_cases[0].nodes==503 && cfg.ring_cases[0].token==5000 && cfg.ring_cases[0].chains==1 );
	assert( cfg.ring_cases[2].nodes==53 && cfg.ring_cases[2].chains==cfg.threads );
	assert( cfg.reader_writer_cases.size()==5 );
	assert( cfg.reader_writer_cases.front()==2000 );
	assert( cfg.reader_writer_cases.back()==20000000 );
}

void test_run_benchmarks()
{
	config cfg;
	cfg.threads = 2;
	cfg.quiesce_rounds = 1;
	cfg.quiesce_pause_ms = 1;
	cfg.ring_cases.clear();
	config::ring_case small = { 5, 20, 2 };
	cfg.ring_cases.push_back(small);
	cfg.reader_writer_cases.clear();
	cfg.reader_writer_cases.push_back(10);

	std::ostringstream os;
	run_benchmarks(cfg, os);

	std::istringstream lines(os.str());
	std::string line;
	int count=0;
	while( std::getline(lines, line) )
	{
		switch( count++ )
		{
		case 0: assert( line.find("ChGive: ")==0 ); break;
		case 1: assert( line.find("MbSend: ")==0 ); break;
		case 2: assert( line.find("ChSend: ")==0 ); break;
		case 3: assert( line.find("MPPost: ")==0 ); break;
		case 4: assert( line.find("Literal: ")==0 ); break;
		case 5: assert( line.find("Tweaked: ")==0 ); break;
		}
		if( count<=4 )
			assert( line.find(" - 40m/")!=std::string::npos && line.find("- [1; 1]")!=std::string::npos );
		else
			assert( line.find(" hops per second")!=std::string::npos );
	}
	assert( count==6 );
}

std::unique_ptr<ring> make_unbuildable_ring(int, channel<int> &, scheduler &)
{
	throw std::runtime_error("cannot build ring");
}

const thread_ring::variant unbuildable = { "Unbuildable", &make_unbuildable_ring, false };

void test_failed_run_prints_nothing()
{
	config cfg;
	cfg.threads = 2;
	cfg.quiesce_rounds = 1;
	cfg.quiesce_pause_ms = 1;
	cfg.variants.clear();
	cfg.variants.push_back(&thread_ring::ch_send);
	cfg.variants.push_back(&unbuildable);
	cfg.variants.push_back(&thread_ring::mp_post);
	cfg.ring_cases.clear();
	config::ring_case small = { 5, 20, 1 };
	cfg.ring_cases.push_back(small);
	cfg.reader_writer_cases.clear();

	std::ostringstream os;
	bool caught=false;
	try
	{
		run_benchmarks(cfg, os);
	}
	catch( std::runtime_error & ex )
	{
		caught = std::string(ex.what())=="cannot build ring";
	}
	assert( caught );

	// Only the run before the failure printed a line.
	const std::string output = os.str();
	assert( output.find("ChSend: ")==0 );
	assert( output.find('\n')==output.size()-1 );
	assert( output.find("Unbuildable")==std::string::npos );
	assert( output.find("MPPost")==std::string::npos );
}

void test_quiesce()
{
	scheduler sched;
	basic t(sched);
	int count=0;
	t.active_fn( [&]() { ++count; } );
	quiesce(sched, 1, 1);
	assert( count==1 );
}

int main()
{
	test_throughput();
	test_timer();
	test_message_line();
	test_hops_line();
	test_ring_measurement();
	test_rings_outlive_measurement();
	test_reader_writer_measurement();
	test_validation_failure();
	test_config();
	test_run_benchmarks();
	test_failed_run_prints_nothing();
	test_quiesce();
	return 0;
}
