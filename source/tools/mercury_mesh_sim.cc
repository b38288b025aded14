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

#include "common/mesh_config.h"
#include "transfer_layer/file_payload.h"
#include "transfer_layer/mesh_endpoint.h"
#include "transfer_layer/simulated_link.h"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

// Transfers a file between two endpoints over a simulated lossy mesh with
// the protocol timings scaled down, then prints what the link did.

static void usage(const char* name)
{
	printf("usage: %s [-v|-d] <file> [loss_percent] [seed]\n", name);
}

int main(int argc, char* argv[])
{
	int arg=1;
	while(arg < argc && argv[arg][0] == '-')
	{
		if(strcmp(argv[arg], "-v") == 0)
			g_verbose=true;
		else if(strcmp(argv[arg], "-d") == 0)
			g_verbose=g_debug=true;
		else
		{
			usage(argv[0]);
			return 2;
		}
		arg++;
	}
	if(arg >= argc)
	{
		usage(argv[0]);
		return 2;
	}

	std::string path=argv[arg++];
	double loss=(arg < argc) ? atof(argv[arg++]) / 100.0 : 0.1;
	unsigned int seed=(arg < argc) ? (unsigned int)strtoul(argv[arg++], NULL, 10) : 1;

	st_mesh_config config;
	config.chunk_delay_ms=20;
	config.min_chunk_delay_ms=5;
	config.max_chunk_delay_ms=200;
	config.retry_base_delay_ms=10;
	config.wait_rounds=20;
	config.wait_round_ms=250;
	config.wait_poll_ms=5;
	config.stall_check_ms=100;
	config.stall_request_ms=300;
	config.transfer_timeout_ms=3000;
	config.chunk_overhead_ms=10;
	config.timeout_cap_ms=10000;
	config.completed_retention_ms=10000;
	config.ok_spacing_ms=20;
	if(mesh_config_validate(&config) != SUCCESS)
		return 2;

	const std::string node_a="!a0000001";
	const std::string node_b="!b0000002";

	cl_simulated_link link(seed);
	cl_transport* transport_a=link.add_node(node_a);
	cl_transport* transport_b=link.add_node(node_b);

	cl_file_payload_sink sink_a(".", "sim_a");
	cl_file_payload_sink sink_b(".", "sim_received");
	cl_mesh_endpoint endpoint_a(node_a, transport_a, &sink_a, config);
	cl_mesh_endpoint endpoint_b(node_b, transport_b, &sink_b, config);
	link.attach(node_a, &endpoint_a);
	link.attach(node_b, &endpoint_b);
	link.set_data_loss(loss);
	link.set_text_loss(loss);

	printf("[SIM] %s -> %s, loss %.1f%%, seed %u\n", node_a.c_str(), node_b.c_str(), loss * 100.0, seed);
	fflush(stdout);

	endpoint_a.start();
	endpoint_b.start();

	cl_file_payload_source source(path);
	st_send_stats stats;
	int result=endpoint_a.send_from_source(node_b, &source, &stats);

	endpoint_a.stop();
	endpoint_b.stop();

	printf("[SIM] Result: %s\n", cl_sender::result_string(result));
	printf("[SIM] Data packets: %d delivered, %d lost\n", link.get_data_delivered(), link.get_data_dropped());
	printf("[SIM] Text messages: %d delivered, %d lost\n", link.get_text_delivered(), link.get_text_dropped());
	fflush(stdout);

	return (result == TRANSFER_COMPLETED) ? 0 : 1;
}
