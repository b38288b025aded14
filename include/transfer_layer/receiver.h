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

#ifndef INC_RECEIVER_H_
#define INC_RECEIVER_H_

#include "common/mesh_config.h"
#include "compression/mercury_compress.h"
#include "transfer_layer/transfer_key.h"
#include "transfer_layer/transport.h"
#include <pthread.h>
#include <map>
#include <set>
#include <string>
#include <vector>

// cl_receiver::on_chunk results
#define CHUNK_STORED         1   // stored, transfer still incomplete
#define CHUNK_DELIVERED      2   // last chunk, payload handed to the sink
#define CHUNK_ALREADY_DONE   3   // transfer completed earlier, OK re-sent
#define CHUNK_DROPPED       -1   // malformed, inconsistent, or its transfer is being delivered
#define CHUNK_DISCARDED     -2   // transfer dropped: CRC, decompression or sink failure

#define RECORD_ACTIVE   0
#define RECORD_TIMEOUT  1

struct st_transfer_progress
{
	std::string sender;
	uint32_t transfer_id = 0;
	int received_chunks = 0;
	int total_chunks = 0;
	int percent = 0;
	uint32_t bytes_received = 0;
	uint32_t total_size = 0;
	long long elapsed_ms = 0;
	double bytes_per_second = 0.0;
	int status = RECORD_ACTIVE;
};

struct st_sweep_result
{
	int requests_sent = 0;    // REQ text messages handed to the transport
	int timed_out = 0;        // records newly marked RECORD_TIMEOUT
	int expired = 0;          // records discarded after the adaptive timeout
	int purged = 0;           // completed-cache entries past the grace window
};

class cl_receiver
{
public:
	cl_receiver(cl_transport* transport, cl_payload_sink* sink, const st_mesh_config& config);
	~cl_receiver();

	int on_chunk(const std::string& sender, const uint8_t* frame, size_t len);
	int on_chunk(const std::string& sender, const uint8_t* frame, size_t len, long long now_ms);

	// One stall sweep: retransmission requests, timeout marking, expiry
	// and completed-cache purge. Called periodically by cl_stall_monitor.
	void check_stalled(long long now_ms, st_sweep_result* result);

	void get_progress(long long now_ms, std::vector<st_transfer_progress>* progress);
	int get_missing(const std::string& sender, uint32_t transfer_id, std::vector<int>* missing);
	int get_active_count();
	int get_completed_count();

private:
	struct st_transfer_record
	{
		std::vector<std::vector<uint8_t> > chunks;
		std::vector<bool> present;
		int received;
		uint32_t bytes;
		uint32_t total_size;
		uint32_t crc;
		bool compressed;
		long long created;
		long long last_update;
		long long last_request;
		int status;
	};

	struct st_stall_request
	{
		std::string sender;
		uint32_t transfer_id;
		std::vector<int> missing;
	};

	typedef std::map<st_transfer_key, st_transfer_record> transfer_map;

	static void list_missing(const st_transfer_record& record, std::vector<int>* missing);
	void discard_other_transfers(const st_transfer_key& key);
	int finish_transfer(transfer_map::iterator it, long long now_ms, std::vector<uint8_t>* payload);
	void send_ok(const std::string& sender, uint32_t transfer_id, int repeats);

	cl_transport* transport;
	cl_payload_sink* sink;
	st_mesh_config config;
	cl_compressor decompressor;

	transfer_map transfers;
	std::map<st_transfer_key, long long> completed;   // confirmed to the sender, by completion time
	std::set<st_transfer_key> delivering;             // reassembled, sink not yet returned
	pthread_mutex_t mutex;
};

#endif
