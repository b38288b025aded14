/*
 * Mercury Mesh payload compression (zstd).
 *
 * Operates at **transfer level**: the sender compresses the entire payload
 * once, before fragmentation, and the receiver decompresses the reassembled
 * stream after its CRC has been verified.  No per-chunk framing is added;
 * the compressed stream is a single zstd frame that records its own content
 * size, which the receiver checks against the 10 MB bound before allocating.
 *
 * Every payload handed in is run through zstd; the result is kept only if
 * it saves more than the configured fraction (5% by default). Already
 * encoded images normally fail that test and go out raw. The Shannon
 * entropy of the input is logged alongside the result.
 */

#ifndef MERCURY_COMPRESS_H
#define MERCURY_COMPRESS_H

#include <cstddef>
#include <cstdint>
#include <vector>

#define COMPRESS_APPLIED        1
#define COMPRESS_SKIPPED        0

class cl_compressor {
public:
	cl_compressor();
	~cl_compressor();

	int init(int level);   // Allocate zstd contexts, returns SUCCESS or ERROR_
	void deinit();         // Free both contexts
	bool is_initialized() const { return initialized; }

	// TX: compress the whole payload into out.
	// Returns COMPRESS_APPLIED when out holds a zstd frame smaller than
	// in.size() * (1 - min_saving), COMPRESS_SKIPPED when the raw payload
	// should be sent instead (out is left empty), ERROR_ on a zstd failure.
	int compress_payload(const std::vector<uint8_t>& in, double min_saving, std::vector<uint8_t>& out);

	// RX: decompress one zstd frame. Rejects frames without a declared
	// content size or declaring more than max_out bytes.
	// Returns SUCCESS or ERROR_.
	int decompress_payload(const uint8_t* in, size_t in_len, size_t max_out, std::vector<uint8_t>& out);

	// Shannon entropy in bits per byte, 0.0 = constant, 8.0 = uniform.
	static float quick_entropy(const unsigned char* data, size_t len);

private:
	void* zstd_cctx;   // ZSTD_CCtx*
	void* zstd_dctx;   // ZSTD_DCtx*
	int level;
	bool initialized;
};

#endif
