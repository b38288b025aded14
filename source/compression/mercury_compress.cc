/*
 * Mercury Mesh payload compression (zstd).
 *
 * TX: zstd → keep only if the saving is worthwhile.
 * RX: read declared content size → bound check → decompress.
 *
 * zstd from Facebook (BSD-3-Clause).
 */

#include "compression/mercury_compress.h"
#include "common/mesh_defines.h"
#include <cstdio>
#include <cmath>

#include <zstd.h>

// ---------- cl_compressor ----------

cl_compressor::cl_compressor()
{
	zstd_cctx = nullptr;
	zstd_dctx = nullptr;
	level = MESH_ZSTD_LEVEL;
	initialized = false;
}

cl_compressor::~cl_compressor()
{
	deinit();
}

int cl_compressor::init(int _level)
{
	if (initialized) return SUCCESS;

	zstd_cctx = ZSTD_createCCtx();
	zstd_dctx = ZSTD_createDCtx();

	if (!zstd_cctx || !zstd_dctx)
	{
		printf("[COMPRESS] Failed to allocate zstd contexts\n");
		fflush(stdout);
		deinit();
		return ERROR_;
	}

	level = _level;
	if (level < 1) level = 1;
	if (level > ZSTD_maxCLevel()) level = ZSTD_maxCLevel();

	size_t rc = ZSTD_CCtx_setParameter((ZSTD_CCtx*)zstd_cctx, ZSTD_c_compressionLevel, level);
	if (ZSTD_isError(rc))
	{
		printf("[COMPRESS] Bad compression level %d: %s\n", level, ZSTD_getErrorName(rc));
		fflush(stdout);
		deinit();
		return ERROR_;
	}
	// The receiver sizes its output buffer from the frame header.
	ZSTD_CCtx_setParameter((ZSTD_CCtx*)zstd_cctx, ZSTD_c_contentSizeFlag, 1);

	initialized = true;
	if (g_debug)
	{
		printf("[COMPRESS] Initialized: zstd (level %d)\n", level);
		fflush(stdout);
	}
	return SUCCESS;
}

void cl_compressor::deinit()
{
	if (zstd_cctx)
	{
		ZSTD_freeCCtx((ZSTD_CCtx*)zstd_cctx);
		zstd_cctx = nullptr;
	}
	if (zstd_dctx)
	{
		ZSTD_freeDCtx((ZSTD_DCtx*)zstd_dctx);
		zstd_dctx = nullptr;
	}
	initialized = false;
}

// ---------- Shannon entropy (bits per byte) ----------

float cl_compressor::quick_entropy(const unsigned char* data, size_t len)
{
	if (len == 0) return 8.0f;
	size_t freq[256] = {0};
	for (size_t i = 0; i < len; i++)
		freq[data[i]]++;

	float entropy = 0.0f;
	float inv_len = 1.0f / (float)len;
	for (int i = 0; i < 256; i++)
	{
		if (freq[i] == 0) continue;
		float p = (float)freq[i] * inv_len;
		entropy -= p * log2f(p);
	}
	return entropy;
}

// ---------- Payload compress (TX) ----------

int cl_compressor::compress_payload(const std::vector<uint8_t>& in, double min_saving, std::vector<uint8_t>& out)
{
	out.clear();
	if (!initialized || in.empty())
		return ERROR_;

	// Byte entropy misses repeating structure, so it is only reported, never used to skip.
	float entropy = quick_entropy(in.data(), in.size());

	out.resize(ZSTD_compressBound(in.size()));
	size_t result = ZSTD_compress2((ZSTD_CCtx*)zstd_cctx, out.data(), out.size(), in.data(), in.size());
	if (ZSTD_isError(result))
	{
		printf("[COMPRESS] zstd error: %s\n", ZSTD_getErrorName(result));
		fflush(stdout);
		out.clear();
		return ERROR_;
	}
	out.resize(result);

	double limit = (double)in.size() * (1.0 - min_saving);
	printf("[COMPRESS] %zu -> %zu bytes (zstd, entropy=%.1f)\n", in.size(), out.size(), entropy);
	if ((double)out.size() >= limit)
	{
		printf("[COMPRESS] Not beneficial (%zu >= %.0f), sending raw\n", out.size(), limit);
		fflush(stdout);
		out.clear();
		return COMPRESS_SKIPPED;
	}
	printf("[COMPRESS] Saving %.1f%%\n", (1.0 - (double)out.size() / (double)in.size()) * 100.0);
	fflush(stdout);
	return COMPRESS_APPLIED;
}

// ---------- Payload decompress (RX) ----------

int cl_compressor::decompress_payload(const uint8_t* in, size_t in_len, size_t max_out, std::vector<uint8_t>& out)
{
	out.clear();
	if (!initialized || in == nullptr || in_len == 0)
		return ERROR_;

	unsigned long long declared = ZSTD_getFrameContentSize(in, in_len);
	if (declared == ZSTD_CONTENTSIZE_ERROR)
	{
		printf("[DECOMPRESS] Not a zstd frame\n");
		fflush(stdout);
		return ERROR_;
	}
	if (declared == ZSTD_CONTENTSIZE_UNKNOWN || declared == 0)
	{
		printf("[DECOMPRESS] Frame has no usable content size\n");
		fflush(stdout);
		return ERROR_;
	}
	if (declared > (unsigned long long)max_out)
	{
		printf("[DECOMPRESS] Declared size %llu exceeds limit %zu\n", declared, max_out);
		fflush(stdout);
		return ERROR_;
	}

	out.resize((size_t)declared);
	size_t result = ZSTD_decompressDCtx((ZSTD_DCtx*)zstd_dctx, out.data(), out.size(), in, in_len);
	if (ZSTD_isError(result))
	{
		printf("[DECOMPRESS] zstd error: %s\n", ZSTD_getErrorName(result));
		fflush(stdout);
		out.clear();
		return ERROR_;
	}
	if (result != (size_t)declared)
	{
		printf("[DECOMPRESS] zstd error: expected %llu, got %zu\n", declared, result);
		fflush(stdout);
		out.clear();
		return ERROR_;
	}
	return SUCCESS;
}
