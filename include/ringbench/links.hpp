/* Ringbench: message-passing micro-benchmarks
 * Copyright (C) Calum Grant 2012
 */

#ifndef RINGBENCH_LINKS_INCLUDED
#define RINGBENCH_LINKS_INCLUDED

#include "channel.hpp"
#include "buffered_channel.hpp"
#include "mailbox.hpp"

namespace ringbench
{
	/*	Link policies: how a value travels from one task to the next.
		Each names the primitive, how to receive from it and how to pass a
		value on. The continuation of a forward is always posted to the
		sending task, so a long run of sends uses no stack. */
	namespace links
	{
		// Rendezvous: the sender waits until the receiver has taken the value.
		struct give
		{
			typedef channel<int> primitive_type;

			template<typename Fn>
			static void take(primitive_type & p, basic & self, Fn fn)
			{
				p.take(self, fn);
			}

			template<typename Fn>
			static void forward(primitive_type & p, basic & self, int value, Fn next)
			{
				p.give(self, value, next);
			}
		};

		// Fire and forget onto a buffered channel.
		struct send
		{
			typedef buffered_channel<int> primitive_type;

			template<typename Fn>
			static void take(primitive_type & p, basic & self, Fn fn)
			{
				p.take(self, fn);
			}

			template<typename Fn>
			static void forward(primitive_type & p, basic & self, int value, Fn next)
			{
				p.send(value);
				self.active_fn(next);
			}
		};

		// Fire and forget into the receiver's mailbox.
		struct mail
		{
			typedef mailbox<int> primitive_type;

			template<typename Fn>
			static void take(primitive_type & p, basic & self, Fn fn)
			{
				p.take(self, fn);
			}

			template<typename Fn>
			static void forward(primitive_type & p, basic & self, int value, Fn next)
			{
				p.send(value);
				self.active_fn(next);
			}
		};
	}
}

#endif
