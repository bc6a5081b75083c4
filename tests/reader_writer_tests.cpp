/* Ringbench: message-passing micro-benchmarks
 * Copyright (C) Calum Grant 2012
 */

#undef NDEBUG
#include <ringbench/reader_writer.hpp>

#include <cassert>
#include <cstring>
#include <stdexcept>

using namespace ringbench;

template<typename Strategy>
void test_sums(int threads)
{
	scheduler sched;
	assert( Strategy::run(5, threads, sched)==15 );
	assert( Strategy::run(0, threads, sched)==0 );
	assert( Strategy::run(1, threads, sched)==1 );
	assert( Strategy::run(2000, threads, sched)==reader_writer::expected_sum(2000) );
}

template<typename Strategy>
void test_negative()
{
	bool caught=false;
	try
	{
		Strategy::run(-1, 1);
	}
	catch( std::invalid_argument & )
	{
		caught=true;
	}
	assert( caught );
}

void test_expected_sum()
{
	assert( reader_writer::expected_sum(0)==0 );
	assert( reader_writer::expected_sum(5)==15 );
	assert( reader_writer::expected_sum(20000000)==200000010000000LL );
}

void test_names()
{
	assert( !strcmp(reader_writer::literal<>::name(), "Literal") );
	assert( !strcmp(reader_writer::tweaked<>::name(), "Tweaked") );
}

template<typename Link>
void test_link()
{
	test_sums<reader_writer::literal<Link> >(1);
	test_sums<reader_writer::literal<Link> >(4);
	test_sums<reader_writer::tweaked<Link> >(1);
	test_sums<reader_writer::tweaked<Link> >(4);
}

void test_large()
{
	scheduler sched;
	assert( reader_writer::literal<>::run(200000, 2, sched)==reader_writer::expected_sum(200000) );
	assert( reader_writer::tweaked<>::run(200000, 2, sched)==reader_writer::expected_sum(200000) );
}

int main()
{
	test_expected_sum();
	test_names();

	test_link<links::give>();
	test_link<links::send>();
	test_link<links::mail>();

	test_negative<reader_writer::literal<> >();
	test_negative<reader_writer::tweaked<> >();

	test_large();
	return 0;
}
