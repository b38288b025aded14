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

#include "transfer_layer/sender.h"
#include "transfer_layer/frame_codec.h"
#include "compression/mercury_compress.h"
#include "common/crc.h"
#include "common/os_interop.h"
#include "common/timer.h"
#include <cstdio>

cl_sender::cl_sender(cl_transport* _transport, cl_control_mailbox* _mailbox, const st_mesh_config& _config)
{
	this->transport=_transport;
	this->mailbox=_mailbox;
	this->config=_config;
	this->last_transfer_id=0;
	this->has_last_transfer_id=false;
	MUTEX_INIT(&mutex);
}

cl_sender::~cl_sender()
{
	MUTEX_DESTROY(&mutex);
}

const char* cl_sender::result_string(int result)
{
	switch(result)
	{
	case TRANSFER_COMPLETED:
		return "completed";
	case TRANSFER_INCOMPLETE:
		return "possibly incomplete";
	case TRANSFER_FAILED:
		return "failed";
	case TRANSFER_BUSY:
		return "destination busy";
	case TRANSFER_REJECTED:
		return "rejected";
	default:
		return "unknown";
	}
}

uint32_t cl_sender::generate_transfer_id()
{
	MUTEX_LOCK(&mutex);
	uint32_t id=(uint32_t)(get_wall_time_ms() & 0xFFFFFFFFLL);
	// Two sends within the same millisecond must still differ.
	if(has_last_transfer_id && (int32_t)(id - last_transfer_id) <= 0)
		id=last_transfer_id + 1;
	last_transfer_id=id;
	has_last_transfer_id=true;
	MUTEX_UNLOCK(&mutex);
	return id;
}

int cl_sender::claim_destination(const std::string& destination)
{
	int success=ERROR_;
	MUTEX_LOCK(&mutex);
	if(busy_destinations.find(destination) == busy_destinations.end())
	{
		busy_destinations.insert(destination);
		success=SUCCESS;
	}
	MUTEX_UNLOCK(&mutex);
	return success;
}

void cl_sender::release_destination(const std::string& destination)
{
	MUTEX_LOCK(&mutex);
	busy_destinations.erase(destination);
	MUTEX_UNLOCK(&mutex);
}

int cl_sender::send(const std::string& destination, const std::vector<uint8_t>& payload, st_send_stats* stats)
{
	st_send_stats local_stats;
	if(stats == NULL)
		stats=&local_stats;
	*stats=st_send_stats();

	if(payload.empty())
	{
		printf("[TX] Refusing empty payload for %s\n", destination.c_str());
		fflush(stdout);
		return TRANSFER_REJECTED;
	}
	if(payload.size() > config.max_payload_size)
	{
		printf("[TX] Payload of %zu bytes exceeds the %u byte limit\n", payload.size(), config.max_payload_size);
		fflush(stdout);
		return TRANSFER_REJECTED;
	}
	if(claim_destination(destination) != SUCCESS)
	{
		printf("[TX] Transfer to %s already in progress, not starting another\n", destination.c_str());
		fflush(stdout);
		return TRANSFER_BUSY;
	}

	st_pending_send pending(config);
	pending.destination=destination;

	if(prepare(payload, &pending) != SUCCESS)
	{
		release_destination(destination);
		return TRANSFER_REJECTED;
	}

	mailbox->open(destination, pending.transfer_id);

	cl_timer transfer_timer;
	transfer_timer.start();

	int result=transmit_all(&pending);
	if(result == SUCCESS)
	{
		printf("[TX] Initial send complete. Waiting for receiver...\n");
		fflush(stdout);
		result=wait_for_receiver(&pending);
	}
	else
	{
		result=TRANSFER_FAILED;
	}

	transfer_timer.stop();
	mailbox->close(destination, pending.transfer_id);
	release_destination(destination);

	fill_stats(pending, (uint32_t)payload.size(), transfer_timer.get_elapsed_time_ms(), stats);

	printf("\n--- TRANSFER SUMMARY ---\n");
	printf("Transfer  : %08x -> %s (%s)\n", stats->transfer_id, destination.c_str(), result_string(result));
	printf("Chunks    : %d\n", stats->chunks);
	printf("Final Size: %u bytes%s\n", stats->transmitted_size, stats->compressed ? " (compressed)" : "");
	printf("Time Taken: %.1f seconds\n", stats->elapsed_ms / 1000.0);
	printf("Avg Speed : %.2f B/s\n", stats->bytes_per_second);
	printf("Retries   : %d\n", stats->retries);
	printf("------------------------\n\n");
	fflush(stdout);

	return result;
}

int cl_sender::prepare(const std::vector<uint8_t>& payload, st_pending_send* pending)
{
	pending->transfer_id=generate_transfer_id();
	pending->crc=CRC32_calc(payload.data(), payload.size());
	pending->total_size=(uint32_t)payload.size();

	printf("[TX] Transfer ID: %08x, payload %u bytes, CRC %08x\n", pending->transfer_id, pending->total_size, pending->crc);

	std::vector<uint8_t> compressed_data;
	if(config.compress_payload && payload.size() > (size_t)config.compress_min_size)
	{
		cl_compressor compressor;
		int rc=ERROR_;
		if(compressor.init(config.zstd_level) == SUCCESS)
			rc=compressor.compress_payload(payload, config.compress_min_saving, compressed_data);
		if(rc == COMPRESS_APPLIED)
		{
			pending->compressed=true;
			pending->total_size=(uint32_t)compressed_data.size();
			pending->crc=CRC32_calc(compressed_data.data(), compressed_data.size());
			printf("[TX] New CRC after compression: %08x\n", pending->crc);
		}
		else if(rc == ERROR_)
		{
			printf("[TX] Compression failed, sending raw\n");
		}
	}
	const std::vector<uint8_t>& data=pending->compressed ? compressed_data : payload;

	size_t chunk_payload=(size_t)mesh_chunk_payload_size(config);
	size_t nChunks=(data.size() + chunk_payload - 1) / chunk_payload;
	if(nChunks > MESH_MAX_CHUNKS)
	{
		printf("[TX] %zu bytes need %zu chunks of %zu bytes, protocol limit is %d\n",
			data.size(), nChunks, chunk_payload, MESH_MAX_CHUNKS);
		fflush(stdout);
		return ERROR_;
	}

	st_transfer_header header;
	header.transfer_id=pending->transfer_id;
	header.total_chunks=(uint8_t)nChunks;
	header.compressed=pending->compressed;
	header.crc32=pending->crc;
	header.total_size=pending->total_size;

	pending->frames.resize(nChunks);
	for(size_t i=0;i<nChunks;i++)
	{
		size_t offset=i * chunk_payload;
		size_t len=data.size() - offset;
		if(len > chunk_payload)
			len=chunk_payload;
		header.chunk_index=(uint8_t)i;
		int status=frame_encode(header, data.data() + offset, len, pending->frames[i]);
		if(status != FRAME_OK)
		{
			printf("[TX] Cannot encode chunk %zu: %s\n", i, frame_status_string(status));
			fflush(stdout);
			return ERROR_;
		}
	}

	printf("[TX] Creating %zu chunks of %zu bytes each, %u bytes total\n", nChunks, chunk_payload, pending->total_size);
	fflush(stdout);
	return SUCCESS;
}

int cl_sender::transmit_frame(st_pending_send* pending, int index)
{
	const std::vector<uint8_t>& frame=pending->frames[index];
	int nChunks=(int)pending->frames.size();

	for(int attempt=1;attempt<=config.max_retries;attempt++)
	{
		if(transport->send_data(frame.data(), frame.size(), pending->destination, true) == SUCCESS)
		{
			pending->pacer.record_success();
			if(g_debug)
			{
				printf("[TX] Chunk %d/%d sent: %zu bytes\n", index + 1, nChunks, frame.size());
				fflush(stdout);
			}
			return SUCCESS;
		}

		pending->pacer.record_failure();
		pending->failed_attempts++;
		pending->retries++;
		printf("[TX] Chunk %d/%d failed (attempt %d/%d)\n", index + 1, nChunks, attempt, config.max_retries);
		if(attempt < config.max_retries)
		{
			int shift=attempt - 1;
			if(shift > MESH_MAX_RETRIES_LIMIT - 1)
				shift=MESH_MAX_RETRIES_LIMIT - 1;
			long retry_delay=(long)config.retry_base_delay_ms << shift;
			printf("[TX] Retrying in %ld ms...\n", retry_delay);
			fflush(stdout);
			msleep(retry_delay);
		}
		fflush(stdout);
	}
	return ERROR_;
}

int cl_sender::transmit_all(st_pending_send* pending)
{
	int nChunks=(int)pending->frames.size();
	for(int i=0;i<nChunks;i++)
	{
		if(transmit_frame(pending, i) != SUCCESS)
		{
			printf("[TX] Failed to send chunk %d after %d attempts. Aborting transfer %08x.\n",
				i + 1, config.max_retries, pending->transfer_id);
			fflush(stdout);
			return ERROR_;
		}

		if(g_verbose)
		{
			printf("[TX] Progress %d/%d chunks (%d retries)\n", i + 1, nChunks, pending->retries);
			fflush(stdout);
		}

		if(i > 0)
			pending->pacer.update();
		msleep(pending->pacer.get_delay_ms());
	}
	return SUCCESS;
}

void cl_sender::resend_requested(st_pending_send* pending, const std::vector<int>& requested)
{
	int nChunks=(int)pending->frames.size();
	printf("[TX] Sending %zu requested chunks: %s\n", requested.size(), chunk_list_preview(requested, 10).c_str());
	fflush(stdout);

	for(size_t i=0;i<requested.size();i++)
	{
		int index=requested[i];
		if(index < 0 || index >= nChunks)
		{
			printf("  [!] Requested chunk %d out of range (%d chunks), ignored\n", index, nChunks);
			continue;
		}
		if(transmit_frame(pending, index) == SUCCESS)
		{
			pending->resent++;
			pending->retries++;
			printf("  [RETRY] Sent chunk %d/%d\n", index, nChunks - 1);
		}
		else
		{
			printf("  [!] Failed to resend chunk %d\n", index);
		}
		fflush(stdout);
		msleep(pending->pacer.get_delay_ms());
	}
}

int cl_sender::wait_for_receiver(st_pending_send* pending)
{
	std::vector<int> requested;

	for(int round=0;round<config.wait_rounds;round++)
	{
		cl_timer round_timer;
		round_timer.start();
		while(round_timer.get_elapsed_time_ms() < config.wait_round_ms)
		{
			int status=mailbox->poll(pending->destination, pending->transfer_id, &requested);
			if(status == MAILBOX_COMPLETED)
			{
				printf("[OK] Transfer %08x confirmed complete by %s\n", pending->transfer_id, pending->destination.c_str());
				fflush(stdout);
				return TRANSFER_COMPLETED;
			}
			if(status == MAILBOX_REQUESTED)
			{
				resend_requested(pending, requested);
				continue;
			}
			msleep(config.wait_poll_ms);
		}
		printf("[TX] Waiting... (%d/%d)\n", round + 1, config.wait_rounds);
		fflush(stdout);
	}

	if(mailbox->poll(pending->destination, pending->transfer_id, &requested) == MAILBOX_COMPLETED)
	{
		printf("[OK] Transfer %08x confirmed complete by %s\n", pending->transfer_id, pending->destination.c_str());
		fflush(stdout);
		return TRANSFER_COMPLETED;
	}

	printf("[TX] Transfer %08x may be incomplete (no OK confirmation received)\n", pending->transfer_id);
	fflush(stdout);
	return TRANSFER_INCOMPLETE;
}

void cl_sender::fill_stats(const st_pending_send& pending, uint32_t original_size, long long elapsed_ms, st_send_stats* stats)
{
	stats->transfer_id=pending.transfer_id;
	stats->chunks=(int)pending.frames.size();
	stats->original_size=original_size;
	stats->transmitted_size=pending.total_size;
	stats->compressed=pending.compressed;
	stats->crc=pending.crc;
	stats->retries=pending.retries;
	stats->failed_attempts=pending.failed_attempts;
	stats->resent_chunks=pending.resent;
	stats->final_delay_ms=pending.pacer.get_delay_ms();
	stats->elapsed_ms=elapsed_ms;
	if(elapsed_ms > 0)
		stats->bytes_per_second=(double)pending.total_size * 1000.0 / (double)elapsed_ms;
	else
		stats->bytes_per_second=(double)pending.total_size;
}
