/* Ringbench: message-passing micro-benchmarks
 * Copyright (C) Calum Grant 2012
 */

#ifndef RINGBENCH_READER_WRITER_INCLUDED
#define RINGBENCH_READER_WRITER_INCLUDED

#include "links.hpp"
#include "promise.hpp"

#include <future>
#include <stdexcept>

namespace ringbench
{
	/*	One writer and one reader on a single channel.
		The writer sends n, n-1, ..., 1 and finally 0. The reader adds up what
		it receives and returns the total when it receives 0.
		Both strategies below implement exactly this; they differ only in how
		the control flow is written.
	  */
	namespace reader_writer
	{
		// The total a reader returns for n.
		inline long long expected_sum(int n)
		{
			return (long long)n * (n+1) / 2;
		}

		// Runs the writer and reader of Strategy to completion.
		template<typename Strategy>
		long long run(int n, int threads, scheduler & sched)
		{
			if( n<0 ) throw std::invalid_argument("reader/writer count must not be negative");

			typename Strategy::primitive_type ch;
			typename Strategy::writer w(ch, sched);
			typename Strategy::reader r(ch, sched);
			std::future<long long> sum = r.start();
			w.start(n);

			ringbench::run workers(threads, sched);
			return wait(sum, sched);
		}

		// Each step is a new closure carrying its own state, mirroring the recursion.
		template<typename Link=links::give>
		struct literal
		{
			typedef typename Link::primitive_type primitive_type;

			static const char * name() { return "Literal"; }

			class writer : public basic
			{
			public:
				writer(primitive_type & ch, scheduler & sched) : basic(sched), m_ch(ch) { }

				void start(int n)
				{
					active_fn( [this, n]() { write(n); } );
				}

			private:
				void write(int i)
				{
					if( i==0 )
						Link::forward( m_ch, *this, 0, noop() );
					else
						Link::forward( m_ch, *this, i, [this, i]() { write(i-1); } );
				}

				primitive_type & m_ch;
			};

			class reader : public basic
			{
			public:
				reader(primitive_type & ch, scheduler & sched) : basic(sched), m_ch(ch) { }

				std::future<long long> start()
				{
					std::future<long long> result = m_sum.get_future();
					active_fn( [this]() { read(0); } );
					return result;
				}

			private:
				void read(long long sum)
				{
					Link::take( m_ch, *this, [this, sum](int x)
					{
						if( x==0 )
							m_sum.set_value(sum);
						else
							read(sum+x);
					} );
				}

				primitive_type & m_ch;
				std::promise<long long> m_sum;
			};

			static long long run(int n, int threads, scheduler & sched = default_scheduler)
			{
				return reader_writer::run<literal>(n, threads, sched);
			}
		};

		// The state lives in the task; the same continuation object is reused for every step.
		template<typename Link=links::give>
		struct tweaked
		{
			typedef typename Link::primitive_type primitive_type;

			static const char * name() { return "Tweaked"; }

			class writer : public basic
			{
			public:
				writer(primitive_type & ch, scheduler & sched) : basic(sched), m_ch(ch), m_value(0) { }

				void start(int n)
				{
					m_value = n;
					active_fn( step(this) );
				}

			private:
				struct step
				{
					explicit step(writer * w) : m_writer(w) { }
					void operator()() const { m_writer->give_value(); }
					writer * m_writer;
				};

				struct given
				{
					explicit given(writer * w) : m_writer(w) { }
					void operator()() const { m_writer->after_give(); }
					writer * m_writer;
				};

				void give_value()
				{
					Link::forward( m_ch, *this, m_value, given(this) );
				}

				void after_give()
				{
					if( m_value!=0 )
					{
						--m_value;
						give_value();
					}
				}

				primitive_type & m_ch;
				int m_value;
			};

			class reader : public basic
			{
			public:
				reader(primitive_type & ch, scheduler & sched) : basic(sched), m_ch(ch), m_total(0) { }

				std::future<long long> start()
				{
					std::future<long long> result = m_sum.get_future();
					m_total = 0;
					active_fn( step(this) );
					return result;
				}

			private:
				struct step
				{
					explicit step(reader * r) : m_reader(r) { }
					void operator()() const { m_reader->take_value(); }
					reader * m_reader;
				};

				struct received
				{
					explicit received(reader * r) : m_reader(r) { }
					void operator()(int x) const { m_reader->accept(x); }
					reader * m_reader;
				};

				void take_value()
				{
					Link::take( m_ch, *this, received(this) );
				}

				void accept(int x)
				{
					if( x==0 )
					{
						m_sum.set_value(m_total);
					}
					else
					{
						m_total += x;
						take_value();
					}
				}

				primitive_type & m_ch;
				long long m_total;
				std::promise<long long> m_sum;
			};

			static long long run(int n, int threads, scheduler & sched = default_scheduler)
			{
				return reader_writer::run<tweaked>(n, threads, sched);
			}
		};
	}
}

#endif
