/* Ringbench: message-passing micro-benchmarks
 * Copyright (C) Calum Grant 2012
 */

#undef NDEBUG
#include <ringbench/object.hpp>
#include <ringbench/scheduler.hpp>
#include <ringbench/promise.hpp>

#include <atomic>
#include <cassert>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

struct counter : public ringbench::object<counter>
{
	explicit counter(ringbench::scheduler & sched) : ringbench::object<counter>(sched), total(0) { }
	void active_method(int x) { total += x; }
	int total;
};

void test_method_call()
{
	ringbench::scheduler sched;
	counter c(sched);
	c(1)(2)(3);
	assert( c.total == 0 );
	sched.run();
	assert( c.total == 6 );
}

void test_run_all()
{
	ringbench::scheduler sched;
	ringbench::basic t(sched);
	int count=0;
	t.active_fn( [&]() { ++count; } );
	t.active_fn( [&]() { ++count; } );
	t.active_fn( [&]() { ++count; } );
	assert( !t.empty() );
	t.run();
	assert( count == 3 );
	assert( t.empty() );
	sched.run();	// Clear the activation before t goes away
}

void test_run_one()
{
	ringbench::scheduler sched;
	assert( !sched.run_one() );

	ringbench::basic t(sched);
	int count=0;
	t.active_fn( [&]() { ++count; } );
	assert( sched.run_one() );
	assert( count == 1 );
	assert( !sched.run_one() );
}

void test_serial_order()
{
	ringbench::scheduler sched;
	ringbench::basic t(sched);
	std::vector<int> order;
	for( int i=0; i<1000; ++i )
		t.active_fn( [&order, i]() { order.push_back(i); } );
	{
		ringbench::run workers(4, sched);
	}
	assert( order.size() == 1000 );
	for( int i=0; i<1000; ++i )
		assert( order[i] == i );
}

// Each task reposts itself, so closures are posted from the worker threads.
struct chain : public ringbench::basic
{
	chain(ringbench::scheduler & sched, std::atomic<int> & total) :
		ringbench::basic(sched), m_total(total) { }

	void start(int n)
	{
		active_fn( [this, n]() { step(n); } );
	}

	void step(int n)
	{
		++m_total;
		if( n>1 )
			active_fn( [this, n]() { step(n-1); } );
	}

	std::atomic<int> & m_total;
};

void test_pool()
{
	ringbench::scheduler sched;
	std::atomic<int> total(0);
	std::vector<std::unique_ptr<chain> > chains;
	for( int i=0; i<100; ++i )
		chains.emplace_back(new chain(sched, total));
	{
		ringbench::run workers(4, sched);
		for( int i=0; i<100; ++i )
			chains[i]->start(100);
	}
	assert( total == 10000 );
	for( int i=0; i<100; ++i )
		assert( chains[i]->empty() );
}

void test_wait()
{
	ringbench::scheduler sched;
	ringbench::basic t(sched);
	std::promise<int> result;
	std::future<int> f = result.get_future();
	t.active_fn( [&result]() { result.set_value(42); } );
	// No worker threads: wait() runs the task itself.
	assert( ringbench::wait(f, sched) == 42 );
}

void test_failure()
{
	ringbench::scheduler sched;
	ringbench::basic t(sched);
	std::promise<int> never;
	std::future<int> f = never.get_future();
	t.active_fn( []() { throw std::runtime_error("boom"); } );

	assert( !sched.failed() );
	bool caught=false;
	{
		ringbench::run workers(2, sched);
		try
		{
			ringbench::wait(f, sched);
		}
		catch( std::runtime_error & ex )
		{
			caught = std::string(ex.what()) == "boom";
		}
	}
	assert( caught );
	assert( sched.failed() );
}

void test_no_work_after_failure()
{
	ringbench::scheduler sched;
	ringbench::basic t1(sched), t2(sched);
	int count=0;
	t1.active_fn( []() { throw std::logic_error("first"); } );
	t2.active_fn( [&]() { ++count; } );
	assert( sched.run_one() );
	assert( sched.failed() );

	// t2 is still activated, but the failed scheduler does not run it.
	assert( !sched.run_one() );
	sched.run();
	assert( count == 0 );

	bool caught=false;
	try
	{
		sched.rethrow();
	}
	catch( std::logic_error & ex )
	{
		caught = std::string(ex.what()) == "first";
	}
	assert( caught );
}

void test_failed_take()
{
	ringbench::scheduler sched;
	ringbench::channel<int> ch;
	ringbench::basic t(sched);
	t.active_fn( []() { throw std::runtime_error("no value"); } );

	bool caught=false;
	try
	{
		ringbench::take(ch, sched);
	}
	catch( std::runtime_error & )
	{
		caught = true;
	}
	assert( caught );
}

void test_pause()
{
	ringbench::pause(1);
	ringbench::pause(0);
}

int main()
{
	// Single-task tests
	test_method_call();
	test_run_all();
	test_run_one();
	test_serial_order();
	test_wait();

	// Multiple-task tests
	test_pool();

	// Failures
	test_failure();
	test_no_work_after_failure();
	test_failed_take();

	test_pause();
	return 0;
}
