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

#include "transfer_layer/receiver.h"
#include "transfer_layer/control_channel.h"
#include "transfer_layer/frame_codec.h"
#include "common/crc.h"
#include "common/os_interop.h"
#include <cstdio>

cl_receiver::cl_receiver(cl_transport* _transport, cl_payload_sink* _sink, const st_mesh_config& _config)
{
	this->transport=_transport;
	this->sink=_sink;
	this->config=_config;
	MUTEX_INIT(&mutex);
	if(decompressor.init(config.zstd_level) != SUCCESS)
	{
		printf("[RX] Decompressor unavailable, compressed transfers will be dropped\n");
		fflush(stdout);
	}
}

cl_receiver::~cl_receiver()
{
	MUTEX_DESTROY(&mutex);
}

void cl_receiver::list_missing(const st_transfer_record& record, std::vector<int>* missing)
{
	missing->clear();
	for(size_t i=0;i<record.present.size();i++)
	{
		if(!record.present[i])
			missing->push_back((int)i);
	}
}

int cl_receiver::on_chunk(const std::string& sender, const uint8_t* frame, size_t len)
{
	return on_chunk(sender, frame, len, get_time_ms());
}

int cl_receiver::on_chunk(const std::string& sender, const uint8_t* frame, size_t len, long long now_ms)
{
	st_transfer_header header;
	const uint8_t* payload=NULL;
	size_t payload_len=0;

	int status=frame_decode(frame, len, &header, &payload, &payload_len);
	if(status != FRAME_OK)
	{
		printf("[RX] Dropped packet from %s (%zu bytes): %s\n", sender.c_str(), len, frame_status_string(status));
		fflush(stdout);
		return CHUNK_DROPPED;
	}

	st_transfer_key key(sender, header.transfer_id);
	std::vector<uint8_t> delivered;
	int result;

	MUTEX_LOCK(&mutex);

	std::map<st_transfer_key, long long>::iterator done=completed.find(key);
	if(done != completed.end())
	{
		if(now_ms - done->second < config.completed_retention_ms)
		{
			MUTEX_UNLOCK(&mutex);
			if(g_verbose)
			{
				printf("[RX] Chunk %d of completed transfer %08x from %s, confirming again\n",
					header.chunk_index, header.transfer_id, sender.c_str());
				fflush(stdout);
			}
			send_ok(sender, header.transfer_id, 1);
			return CHUNK_ALREADY_DONE;
		}
		completed.erase(done);
	}

	if(delivering.find(key) != delivering.end())
	{
		MUTEX_UNLOCK(&mutex);
		if(g_verbose)
		{
			printf("[RX] Chunk %d of transfer %08x from %s arrived during delivery, ignored\n",
				header.chunk_index, header.transfer_id, sender.c_str());
			fflush(stdout);
		}
		return CHUNK_DROPPED;
	}

	transfer_map::iterator it=transfers.find(key);
	if(it == transfers.end())
	{
		discard_other_transfers(key);

		st_transfer_record record;
		record.chunks.resize(header.total_chunks);
		record.present.assign(header.total_chunks, false);
		record.received=0;
		record.bytes=0;
		record.total_size=header.total_size;
		record.crc=header.crc32;
		record.compressed=header.compressed;
		record.created=now_ms;
		record.last_update=now_ms;
		record.last_request=now_ms;
		record.status=RECORD_ACTIVE;
		it=transfers.insert(std::make_pair(key, record)).first;

		printf("[RX] Incoming transfer from %s (ID: %08x, %u bytes%s), %d chunks\n",
			sender.c_str(), header.transfer_id, header.total_size,
			header.compressed ? ", compressed" : "", header.total_chunks);
		if(g_debug)
			printf("[RX] New transfer: CRC=%08x\n", header.crc32);
		fflush(stdout);
	}
	else
	{
		const st_transfer_record& existing=it->second;
		if(existing.chunks.size() != header.total_chunks || existing.crc != header.crc32 ||
		   existing.total_size != header.total_size || existing.compressed != header.compressed)
		{
			MUTEX_UNLOCK(&mutex);
			printf("[RX] Dropped chunk %d from %s: header disagrees with transfer %08x\n",
				header.chunk_index, sender.c_str(), header.transfer_id);
			fflush(stdout);
			return CHUNK_DROPPED;
		}
	}

	st_transfer_record& record=it->second;
	int index=header.chunk_index;
	if(!record.present[index])
	{
		record.present[index]=true;
		record.received++;
		record.bytes+=(uint32_t)payload_len;
		if(g_verbose)
			printf("[RX] Chunk %d/%d (%zu bytes)\n", index, header.total_chunks - 1, payload_len);
	}
	else
	{
		record.bytes-=(uint32_t)record.chunks[index].size();
		record.bytes+=(uint32_t)payload_len;
		if(g_verbose)
			printf("[RETRY] Chunk %d/%d (%zu bytes)\n", index, header.total_chunks - 1, payload_len);
	}
	record.chunks[index].assign(payload, payload + payload_len);
	record.last_update=now_ms;
	record.status=RECORD_ACTIVE;

	if(g_verbose)
	{
		printf("[RX] %d/%d chunks, %u/%u bytes\n", record.received, header.total_chunks, record.bytes, record.total_size);
		fflush(stdout);
	}

	if(record.received < (int)record.chunks.size())
	{
		MUTEX_UNLOCK(&mutex);
		return CHUNK_STORED;
	}

	result=finish_transfer(it, now_ms, &delivered);
	MUTEX_UNLOCK(&mutex);

	if(result != SUCCESS)
		return CHUNK_DISCARDED;

	// Completion is only recorded once the sink has accepted the payload.
	int sink_result=sink->on_payload(sender, header.transfer_id, delivered);

	MUTEX_LOCK(&mutex);
	delivering.erase(key);
	if(sink_result == SUCCESS)
		completed[key]=now_ms;
	MUTEX_UNLOCK(&mutex);

	if(sink_result != SUCCESS)
	{
		printf("[RX] Payload sink rejected transfer %08x from %s, no confirmation sent\n",
			header.transfer_id, sender.c_str());
		fflush(stdout);
		return CHUNK_DISCARDED;
	}

	send_ok(sender, header.transfer_id, config.ok_repeats);
	return CHUNK_DELIVERED;
}

void cl_receiver::discard_other_transfers(const st_transfer_key& key)
{
	transfer_map::iterator it=transfers.lower_bound(st_transfer_key(key.node, 0));
	while(it != transfers.end() && it->first.node == key.node)
	{
		if(it->first.transfer_id == key.transfer_id)
		{
			++it;
			continue;
		}
		printf("[RX] Discarding old transfer %08x from %s (%d/%zu chunks)\n",
			it->first.transfer_id, it->first.node.c_str(), it->second.received, it->second.chunks.size());
		fflush(stdout);
		transfers.erase(it++);
	}
}

int cl_receiver::finish_transfer(transfer_map::iterator it, long long now_ms, std::vector<uint8_t>* payload)
{
	st_transfer_key key=it->first;
	st_transfer_record& record=it->second;

	printf("[RX] All %zu chunks received for transfer %08x\n", record.chunks.size(), key.transfer_id);

	std::vector<uint8_t> full;
	full.reserve(record.bytes);
	for(size_t i=0;i<record.chunks.size();i++)
	{
		full.insert(full.end(), record.chunks[i].begin(), record.chunks[i].end());
	}

	uint32_t expected_crc=record.crc;
	uint32_t total_size=record.total_size;
	bool compressed=record.compressed;
	long long duration=now_ms - record.created;
	transfers.erase(it);

	if(full.size() != total_size)
	{
		printf("[RX] Size mismatch! Transfer %08x reassembled to %zu bytes, header says %u\n",
			key.transfer_id, full.size(), total_size);
		fflush(stdout);
		return ERROR_;
	}

	// Integrity is checked on the transmitted stream, before decompression.
	uint32_t crc=CRC32_calc(full.data(), full.size());
	if(crc != expected_crc)
	{
		printf("[RX] CRC mismatch! Transfer %08x from %s corrupted (got %08x, expected %08x)\n",
			key.transfer_id, key.node.c_str(), crc, expected_crc);
		fflush(stdout);
		return ERROR_;
	}

	if(compressed)
	{
		std::vector<uint8_t> decompressed;
		if(decompressor.decompress_payload(full.data(), full.size(), config.max_payload_size, decompressed) != SUCCESS)
		{
			printf("[RX] Decompression failed for transfer %08x from %s\n", key.transfer_id, key.node.c_str());
			fflush(stdout);
			return ERROR_;
		}
		printf("[RX] Decompressed payload: %zu -> %zu bytes\n", full.size(), decompressed.size());
		full.swap(decompressed);
	}

	delivering.insert(key);
	printf("[RX] SUCCESS %zu bytes from %s in %.1fs\n", full.size(), key.node.c_str(), duration / 1000.0);
	fflush(stdout);
	payload->swap(full);
	return SUCCESS;
}

void cl_receiver::send_ok(const std::string& sender, uint32_t transfer_id, int repeats)
{
	std::string ok_msg=control_format_ok(transfer_id);
	int sent=0;
	for(int i=0;i<repeats;i++)
	{
		if(transport->send_text(ok_msg, sender) == SUCCESS)
			sent++;
		else
			printf("[OK] Failed to send %s to %s\n", ok_msg.c_str(), sender.c_str());
		if(i < repeats - 1)
			msleep(config.ok_spacing_ms);
	}
	if(repeats > 1 || g_verbose)
		printf("[OK] Sent confirmation %s to %s (%dx)\n", ok_msg.c_str(), sender.c_str(), sent);
	fflush(stdout);
}

void cl_receiver::check_stalled(long long now_ms, st_sweep_result* result)
{
	st_sweep_result local_result;
	if(result == NULL)
		result=&local_result;
	*result=st_sweep_result();

	std::vector<st_stall_request> requests;
	std::vector<int> missing;

	MUTEX_LOCK(&mutex);

	std::map<st_transfer_key, long long>::iterator done=completed.begin();
	while(done != completed.end())
	{
		if(now_ms - done->second >= config.completed_retention_ms)
		{
			completed.erase(done++);
			result->purged++;
		}
		else
		{
			++done;
		}
	}

	transfer_map::iterator it=transfers.begin();
	while(it != transfers.end())
	{
		st_transfer_record& record=it->second;
		int nChunks=(int)record.chunks.size();
		long long idle=now_ms - record.last_update;
		long long last_activity=(record.last_request > record.last_update) ? record.last_request : record.last_update;
		long long quiet=now_ms - last_activity;
		long long expiry=mesh_adaptive_timeout_ms(config, nChunks);
		list_missing(record, &missing);

		if(idle > expiry)
		{
			printf("[STALL] Transfer %08x from %s timed out (no data for %llds)\n",
				it->first.transfer_id, it->first.node.c_str(), expiry / 1000);
			printf("[STALL] Transfer incomplete: %d/%d chunks received\n", record.received, nChunks);
			if(!missing.empty())
				printf("[STALL] Missing chunks: %s\n", chunk_list_preview(missing, 20).c_str());
			fflush(stdout);
			transfers.erase(it++);
			result->expired++;
			continue;
		}

		if(idle > config.transfer_timeout_ms && record.status == RECORD_ACTIVE)
		{
			record.status=RECORD_TIMEOUT;
			result->timed_out++;
			printf("[STALL] Transfer %08x from %s stalled (no data for %llds), missing %s\n",
				it->first.transfer_id, it->first.node.c_str(), idle / 1000,
				chunk_list_preview(missing, 20).c_str());
			fflush(stdout);
		}

		if(quiet > config.stall_request_ms && !missing.empty())
		{
			st_stall_request request;
			request.sender=it->first.node;
			request.transfer_id=it->first.transfer_id;
			request.missing=missing;
			requests.push_back(request);
			record.last_request=now_ms;
		}
		++it;
	}

	MUTEX_UNLOCK(&mutex);

	for(size_t i=0;i<requests.size();i++)
	{
		std::vector<std::string> messages=control_format_req(requests[i].transfer_id, requests[i].missing, (size_t)config.text_mtu);
		printf("[REQ] Requesting %zu missing chunks of %08x from %s: %s\n",
			requests[i].missing.size(), requests[i].transfer_id, requests[i].sender.c_str(),
			chunk_list_preview(requests[i].missing, 10).c_str());
		for(size_t m=0;m<messages.size();m++)
		{
			if(transport->send_text(messages[m], requests[i].sender) == SUCCESS)
				result->requests_sent++;
			else
				printf("[REQ] Failed to send request to %s\n", requests[i].sender.c_str());
		}
		fflush(stdout);
	}
}

void cl_receiver::get_progress(long long now_ms, std::vector<st_transfer_progress>* progress)
{
	progress->clear();
	MUTEX_LOCK(&mutex);
	for(transfer_map::const_iterator it=transfers.begin();it!=transfers.end();++it)
	{
		const st_transfer_record& record=it->second;
		st_transfer_progress p;
		p.sender=it->first.node;
		p.transfer_id=it->first.transfer_id;
		p.received_chunks=record.received;
		p.total_chunks=(int)record.chunks.size();
		p.percent=p.total_chunks > 0 ? (record.received * 100) / p.total_chunks : 0;
		p.bytes_received=record.bytes;
		p.total_size=record.total_size;
		p.elapsed_ms=now_ms - record.created;
		p.bytes_per_second=p.elapsed_ms > 0 ? (double)record.bytes * 1000.0 / (double)p.elapsed_ms : 0.0;
		p.status=record.status;
		progress->push_back(p);
	}
	MUTEX_UNLOCK(&mutex);
}

int cl_receiver::get_missing(const std::string& sender, uint32_t transfer_id, std::vector<int>* missing)
{
	int success=ERROR_;
	MUTEX_LOCK(&mutex);
	transfer_map::const_iterator it=transfers.find(st_transfer_key(sender, transfer_id));
	if(it != transfers.end())
	{
		list_missing(it->second, missing);
		success=SUCCESS;
	}
	MUTEX_UNLOCK(&mutex);
	return success;
}

int cl_receiver::get_active_count()
{
	MUTEX_LOCK(&mutex);
	int count=(int)transfers.size();
	MUTEX_UNLOCK(&mutex);
	return count;
}

int cl_receiver::get_completed_count()
{
	MUTEX_LOCK(&mutex);
	int count=(int)completed.size();
	MUTEX_UNLOCK(&mutex);
	return count;
}
