/* Ringbench: message-passing micro-benchmarks
 * Copyright (C) Calum Grant 2012
 */

#ifndef RINGBENCH_OBJECT_INCLUDED
#define RINGBENCH_OBJECT_INCLUDED

#include <ringbench/config.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

#ifdef RINGBENCH_USE_BOOST
	#include <boost/thread.hpp>
	#include <boost/thread/mutex.hpp>

	namespace ringbench
	{
		namespace platform
		{
			using namespace boost;
		}
	}
#else
	#include <mutex>
	#include <thread>

	namespace ringbench
	{
		namespace platform
		{
			using namespace std;
		}
	}
#endif


namespace ringbench
{
	// Interface of all schedulable objects.
	struct any_object
	{
		any_object() : m_next(nullptr) { }
		virtual ~any_object();
		virtual void run() throw()=0;
		virtual bool run_some(int n=100) throw()=0;
		virtual void exception_handler() throw();
		any_object * m_next;
	};

	class scheduler;

	// As a convenience, provide a global variable to run all objects.
	extern scheduler default_scheduler;

	// A continuation which does nothing.
	struct noop
	{
		void operator()() const { }
	};

	namespace queueing	// The queuing policy classes
	{
		// Queue of pending closures for one object.
		// The closure being run stays at the head until it has finished, so
		// an enqueue during a run never reports the queue as newly non-empty.
		template< typename Allocator=std::allocator<void> >
		class shared
		{
		public:
			typedef Allocator allocator_type;

		private:
			struct message
			{
				message() : m_next(nullptr) { }
				virtual void run()=0;
				virtual void destroy(allocator_type&)=0;
				message *m_next;
			};

		public:
			shared(const allocator_type & alloc = allocator_type()) :
				m_head(nullptr), m_tail(nullptr), m_allocator(alloc)
			{
			}

			~shared()
			{
				clear();
			}

			// Returns true if the queue was empty, i.e. the owner must be activated.
			template<typename Fn>
			bool enqueue_fn( Fn && fn )
			{
				typedef run_impl<typename std::decay<Fn>::type> impl_type;
				typedef typename std::allocator_traits<allocator_type>::template rebind_alloc<impl_type> impl_allocator;
				typedef std::allocator_traits<impl_allocator> impl_traits;

				impl_allocator realloc(m_allocator);
				impl_type * impl = impl_traits::allocate(realloc, 1);
				try
				{
					impl_traits::construct(realloc, impl, std::forward<Fn>(fn));
				}
				catch (...)
				{
					impl_traits::deallocate(realloc, impl, 1);
					throw;
				}
				return enqueue(impl);
			}

			bool empty() const
			{
				platform::lock_guard<platform::mutex> lock(m_mutex);
				return !m_head;
			}

			bool run_some(any_object * o, int n=100) throw()
			{
				platform::lock_guard<platform::mutex> lock(m_mutex);
				while( m_head && n-->0)
				{
					message * m = m_head;

					m_mutex.unlock();
					try
					{
						m->run();
					}
					catch (...)
					{
						o->exception_handler();
					}
					m_mutex.lock();
					m_head = m_head->m_next;
					if(!m_head) m_tail=nullptr;
					m->destroy(m_allocator);
				}
				return m_head!=nullptr;
			}

			// Destroys all pending messages without running them.
			void clear()
			{
				platform::lock_guard<platform::mutex> lock(m_mutex);
				while( m_head )
				{
					message * m = m_head;
					m_head = m->m_next;
					m->destroy(m_allocator);
				}
				m_tail = nullptr;
			}

		private:
			shared(const shared&);
			shared & operator=(const shared&);

			// Push to tail, pop from head:
			message *m_head, *m_tail;
			bool enqueue(message*impl)
			{
				platform::lock_guard<platform::mutex> lock(m_mutex);
				if( m_tail )
				{
					m_tail->m_next = impl;
					m_tail = impl;
					return false;
				}
				else
				{
					m_head = m_tail = impl;
					return true;
				}
			}

			template<typename Fn>
			struct run_impl : public message
			{
				typedef typename std::allocator_traits<allocator_type>::template rebind_alloc<run_impl> impl_allocator;
				typedef std::allocator_traits<impl_allocator> impl_traits;

				template<typename F>
				explicit run_impl(F && fn) : m_fn(std::forward<F>(fn)) { }
				Fn m_fn;
				void run()
				{
					m_fn();
				}
				void destroy(allocator_type&a)
				{
					impl_allocator realloc(a);
					impl_traits::destroy(realloc, this);
					impl_traits::deallocate(realloc, this, 1);
				}
			};

			allocator_type m_allocator;
			mutable platform::mutex m_mutex;
		};
	}

	/*	A task: an object with its own queue of closures, executed by a scheduler.
		Closures posted to one task run one at a time, in the order posted.
		A task suspends by leaving a continuation with a channel; the channel
		posts the continuation back here once it can proceed.
	  */
	class basic : public any_object
	{
	public:
		typedef queueing::shared<> queue_type;
		typedef queue_type::allocator_type allocator_type;

		explicit basic(scheduler & sched = default_scheduler,
			const allocator_type & alloc = allocator_type());

		// Pending closures are discarded.
		~basic();

		scheduler & get_scheduler() const { return *m_scheduler; }

		bool empty() const { return m_queue.empty(); }

		// Posts fn to run on this task.
		template<typename Fn>
		void active_fn(Fn && fn)
		{
			if( m_queue.enqueue_fn(std::forward<Fn>(fn)) )
				activate();
		}

		// Runs all pending closures in the calling thread.
		// Not threadsafe - do not call unless you know what you are doing.
		void run() throw();

		bool run_some(int n=100) throw();

		// Logs the exception and fails the scheduler.
		void exception_handler() throw();

	private:
		basic(const basic&);
		basic & operator=(const basic&);

		void activate() throw();

		scheduler * m_scheduler;
		queue_type m_queue;
	};

	/*	This is the base class of all message-handling objects.
		Its main role is to implement operator(), which queues a call to
		Derived::active_method() with the same arguments.
	  */
	template<typename Derived, typename ObjectType=basic>
	class object : public ObjectType
	{
	public:
		typedef ObjectType object_type;
		typedef Derived derived_type;

		explicit object(scheduler & sched = default_scheduler) : object_type(sched)
		{
		}

		template<typename... Args>
		derived_type & operator()(Args... args)
		{
			this->active_fn( std::bind(&object::template run_active_method<Args...>, this, args...) );
			return get_derived();
		}

	private:
		derived_type & get_derived()
		{
			return *static_cast<derived_type*>(this);
		}

		template<typename... Args>
		void run_active_method(Args ...args)
		{
			get_derived().active_method(std::move(args)...);
		}
	};

	// Runs the scheduler in a pool of worker threads for the lifetime of this object.
	// The destructor waits until there is no more work, then joins the threads.
	class run
	{
	public:
		explicit run(int threads=platform::thread::hardware_concurrency(), scheduler & sched = default_scheduler);
		~run();
	private:
		run(const run&);
		run & operator=(const run&);
		void join() throw();
		scheduler & m_scheduler;
#ifdef RINGBENCH_USE_BOOST
		typedef boost::thread_group threads;
#else
		typedef std::vector<platform::thread> threads;
#endif
		threads m_threads;
	};
} // namespace ringbench


#endif
