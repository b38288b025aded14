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

#ifndef INC_SENDER_H_
#define INC_SENDER_H_

#include "common/mesh_config.h"
#include "transfer_layer/adaptive_pacer.h"
#include "transfer_layer/control_mailbox.h"
#include "transfer_layer/transport.h"
#include <pthread.h>
#include <set>
#include <string>
#include <vector>

// cl_sender::send results
#define TRANSFER_COMPLETED   2   // receiver confirmed with OK
#define TRANSFER_INCOMPLETE  1   // all chunks sent, no OK within the wait budget
#define TRANSFER_FAILED     -1   // a chunk exhausted its retries, transfer aborted
#define TRANSFER_BUSY       -2   // a transfer to this destination is already running
#define TRANSFER_REJECTED   -3   // payload empty, too large, or needs too many chunks

struct st_send_stats
{
	uint32_t transfer_id = 0;
	int chunks = 0;
	uint32_t original_size = 0;
	uint32_t transmitted_size = 0;
	bool compressed = false;
	uint32_t crc = 0;
	int retries = 0;            // failed attempts plus requested resends
	int failed_attempts = 0;
	int resent_chunks = 0;
	int final_delay_ms = 0;
	long long elapsed_ms = 0;
	double bytes_per_second = 0.0;
};

class cl_sender
{
public:
	cl_sender(cl_transport* transport, cl_control_mailbox* mailbox, const st_mesh_config& config);
	~cl_sender();

	// Blocks for the whole transfer, including the wait for the receiver.
	// Safe to call concurrently for different destinations.
	int send(const std::string& destination, const std::vector<uint8_t>& payload, st_send_stats* stats);

	uint32_t generate_transfer_id();

	static const char* result_string(int result);

private:
	struct st_pending_send
	{
		std::string destination;
		uint32_t transfer_id;
		uint32_t crc;
		bool compressed;
		uint32_t total_size;
		std::vector<std::vector<uint8_t> > frames;
		cl_adaptive_pacer pacer;
		int retries;
		int failed_attempts;
		int resent;

		explicit st_pending_send(const st_mesh_config& config)
			: transfer_id(0), crc(0), compressed(false), total_size(0), pacer(config),
			  retries(0), failed_attempts(0), resent(0) {}
	};

	int prepare(const std::vector<uint8_t>& payload, st_pending_send* pending);
	int transmit_frame(st_pending_send* pending, int index);
	int transmit_all(st_pending_send* pending);
	int wait_for_receiver(st_pending_send* pending);
	void resend_requested(st_pending_send* pending, const std::vector<int>& requested);
	void fill_stats(const st_pending_send& pending, uint32_t original_size, long long elapsed_ms, st_send_stats* stats);

	int claim_destination(const std::string& destination);
	void release_destination(const std::string& destination);

	cl_transport* transport;
	cl_control_mailbox* mailbox;
	st_mesh_config config;

	std::set<std::string> busy_destinations;
	uint32_t last_transfer_id;
	bool has_last_transfer_id;
	pthread_mutex_t mutex;
};

#endif
