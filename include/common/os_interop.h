/*
 * Mercury Mesh: reliable payload transfer over packet radio mesh networks.
 * Copyright (C) 2022-2024 Fadi Jerji
 * Author: Fadi Jerji
 * Email: fadi.jerji@  <gmail.com, caisresearch.com, ieee.org>
 * ORCID: 0000-0002-2076-5831
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as
 * published by the Free Software Foundation, version 3 of the
 * License.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 *
 */

#ifndef INC_OS_INTEROP_H_
#define INC_OS_INTEROP_H_

#include <pthread.h>
#include <unistd.h>
#include <time.h>

#define MUTEX_INIT(m)     pthread_mutex_init(m, NULL)
#define MUTEX_DESTROY(m)  pthread_mutex_destroy(m)
#define MUTEX_LOCK(m)     pthread_mutex_lock(m)
#define MUTEX_UNLOCK(m)   pthread_mutex_unlock(m)

static inline void msleep(long ms)
{
	if(ms <= 0)
		return;
	struct timespec ts;
	ts.tv_sec = ms / 1000;
	ts.tv_nsec = (ms % 1000) * 1000000L;
	while(nanosleep(&ts, &ts) != 0)
	{
		// interrupted by a signal, sleep the remainder
	}
}

// Monotonic milliseconds, unaffected by wall clock changes.
static inline long long get_time_ms()
{
	struct timespec ts;
	clock_gettime(CLOCK_MONOTONIC, &ts);
	return (long long)ts.tv_sec * 1000LL + ts.tv_nsec / 1000000L;
}

// Wall clock milliseconds, used where an identifier must differ across restarts.
static inline long long get_wall_time_ms()
{
	struct timespec ts;
	clock_gettime(CLOCK_REALTIME, &ts);
	return (long long)ts.tv_sec * 1000LL + ts.tv_nsec / 1000000L;
}

#endif
