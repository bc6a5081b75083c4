/* Ringbench: message-passing micro-benchmarks
 * Copyright (C) Calum Grant 2012
 */

#include <ringbench/object.hpp>
#include <ringbench/scheduler.hpp>

#include <chrono>
#include <cstdio>
#include <exception>

// Our global variable, the scheduler.
// Each benchmark run uses its own scheduler; this one serves objects
// constructed without one.
ringbench::scheduler ringbench::default_scheduler;

ringbench::scheduler::scheduler() :
	m_head(nullptr), m_tail(nullptr), m_busy_count(0), m_failed(false)
{
}

ringbench::any_object::~any_object()
{
}

void ringbench::any_object::exception_handler() throw()
{
	try
	{
		throw;
	}
	catch( std::exception & ex )
	{
		// std::cerr is NOT threadsafe.
		fprintf(stderr, "Unhandled exception during message processing: %s\n", ex.what());
	}
	catch( ... )
	{
		fprintf(stderr, "Unhandled exception during message processing\n");
	}
}

void ringbench::scheduler::activate(ObjectPtr p) throw()
{
	platform::lock_guard<platform::mutex> lock(m_mutex);
	p->m_next = nullptr;
	if( m_tail )
		m_tail->m_next = p;
	else
		m_head = p;
	m_tail = p;
}

// Run one item, return true if there was one.
// The mutex is held on entry and on exit, but not whilst the object runs.
bool ringbench::scheduler::locked_run_one()
{
	if( m_head && !failed() )
	{
		ObjectPtr p = m_head;
		m_head = p->m_next;
		if( !m_head ) m_tail = nullptr;
		m_mutex.unlock();
		p->run_some();
		m_mutex.lock();
		return true;
	}
	return false;
}

// Runs until there are no more messages in the entire pool.
// Returns false if there is no more work anywhere.
bool ringbench::scheduler::run_managed() throw()
{
	platform::unique_lock<platform::mutex> lock(m_mutex);
	++m_busy_count;
	while( locked_run_one() )
		;

	// Can be non-zero if the queue is empty, but other threads are processing.
	// The result of processing could be to activate more objects.
	return 0!=--m_busy_count && !failed();
}

bool ringbench::scheduler::run_one()
{
	platform::unique_lock<platform::mutex> lock(m_mutex);
	++m_busy_count;
	bool ran = locked_run_one();
	--m_busy_count;
	return ran;
}

void ringbench::scheduler::run()
{
	while( run_managed() )
	{
		platform::unique_lock<platform::mutex> lock(m_mutex);
#ifdef RINGBENCH_USE_BOOST
		m_ready.timed_wait(lock, boost::posix_time::milliseconds(1));
#else
		m_ready.wait_for(lock, std::chrono::milliseconds(1));
#endif
	}
	platform::unique_lock<platform::mutex> lock(m_mutex);
	m_ready.notify_all();
}

void ringbench::scheduler::start_work() throw()
{
	platform::lock_guard<platform::mutex> lock(m_mutex);
	++m_busy_count;
}

void ringbench::scheduler::stop_work() throw()
{
	platform::lock_guard<platform::mutex> lock(m_mutex);
	if(0==--m_busy_count)
	{
		m_ready.notify_one();
	}
}

void ringbench::scheduler::fail(std::exception_ptr error) throw()
{
	platform::lock_guard<platform::mutex> lock(m_mutex);
	if( !m_error ) m_error = error;
	m_failed.store(true, std::memory_order_release);
	m_ready.notify_all();
}

void ringbench::scheduler::rethrow() const
{
	std::exception_ptr error;
	{
		platform::lock_guard<platform::mutex> lock(m_mutex);
		error = m_error;
	}
	if( error ) std::rethrow_exception(error);
}

void ringbench::pause(int milliseconds)
{
#ifdef RINGBENCH_USE_BOOST
	platform::this_thread::sleep(boost::posix_time::milliseconds(milliseconds));
#else
	platform::this_thread::sleep_for(std::chrono::milliseconds(milliseconds));
#endif
}

ringbench::run::run(int num_threads, scheduler & sched) :
	m_scheduler(sched)
{
	if( num_threads<1 ) num_threads=4;
	m_scheduler.start_work();	// Prevent threads from exiting prematurely
	try
	{
		for( int t=0; t<num_threads; ++t )
#ifdef RINGBENCH_USE_BOOST
			m_threads.create_thread( [&sched]() { sched.run(); } );
#else
			m_threads.push_back( platform::thread( [&sched]() { sched.run(); } ) );
#endif
	}
	catch (...)
	{
		join();
		throw;
	}
}

ringbench::run::~run()
{
	join();
}

void ringbench::run::join() throw()
{
	m_scheduler.stop_work();
#ifdef RINGBENCH_USE_BOOST
	m_threads.join_all();
#else
	for(threads::iterator t=m_threads.begin(); t!=m_threads.end(); ++t)
		t->join();
#endif
}

ringbench::basic::basic(scheduler & sched, const allocator_type & alloc) :
	m_scheduler(&sched), m_queue(alloc)
{
}

ringbench::basic::~basic()
{
	m_queue.clear();
}

void ringbench::basic::run() throw()
{
	while( m_queue.run_some(this) )
		;
}

bool ringbench::basic::run_some(int n) throw()
{
	// Run a few messages from the queue
	// if we still have messages, then reactivate this object.
	if( m_queue.run_some(this, n) )
	{
		activate();
		return true;
	}
	else
	{
		return false;
	}
}

void ringbench::basic::activate() throw()
{
	m_scheduler->activate(this);
}

void ringbench::basic::exception_handler() throw()
{
	std::exception_ptr error = std::current_exception();
	any_object::exception_handler();
	m_scheduler->fail(error);
}
