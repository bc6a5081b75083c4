/* Ringbench: message-passing micro-benchmarks
 * Copyright (C) Calum Grant 2012
 */

#ifndef RINGBENCH_WAIT_QUEUE_INCLUDED
#define RINGBENCH_WAIT_QUEUE_INCLUDED

namespace ringbench
{
	/*	Intrusive FIFO of parked waiters, linked through Node::m_next.
		Not synchronised: the owning primitive guards it with its own mutex.
		The queue does not own its nodes. */
	template<typename Node>
	class wait_queue
	{
	public:
		wait_queue() : m_head(nullptr), m_tail(nullptr) { }

		bool empty() const { return !m_head; }

		void push(Node * n)
		{
			n->m_next = nullptr;
			if( m_tail )
				m_tail->m_next = n;
			else
				m_head = n;
			m_tail = n;
		}

		// Removes the oldest waiter, or returns nullptr.
		Node * pop()
		{
			Node * n = m_head;
			if( n )
			{
				m_head = n->m_next;
				if( !m_head ) m_tail = nullptr;
				n->m_next = nullptr;
			}
			return n;
		}

		// Removes n if it is still waiting.
		bool erase(Node * n)
		{
			Node * prev = nullptr;
			for( Node * i=m_head; i; prev=i, i=i->m_next )
			{
				if( i==n )
				{
					if( prev )
						prev->m_next = i->m_next;
					else
						m_head = i->m_next;
					if( m_tail==i ) m_tail = prev;
					i->m_next = nullptr;
					return true;
				}
			}
			return false;
		}

	private:
		wait_queue(const wait_queue&);
		wait_queue & operator=(const wait_queue&);

		Node *m_head, *m_tail;
	};
}

#endif
