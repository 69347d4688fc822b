#include "vcdiff/abi.h"
#include "backend/io.hpp"

#include <google/vcdecoder.h>
#include <google/vcencoder.h>

#include <new>
#include <string>
#include <vector>

using vcdiff::backend_io::input_reader;
using vcdiff::backend_io::output_writer;
using vcdiff::backend_io::source_reader;

namespace {

  // Moves whatever the codec produced so far to the output.
  bool flush_output(output_writer& output, std::string& produced) {
    const auto ok = output.write(reinterpret_cast<const uint8_t*>(produced.data()), produced.size());
    produced.clear();
    return ok;
  }

  vcdiff_status_type write_failure_status(const vcdiff_backend_ctx* p_ctx) {
    return vcdiff::backend_io::output_is_stream(p_ctx)
      ? vcdiff_status_type_io_error
      : vcdiff_status_type_out_of_memory;
  }

  // Opens the source and maps it into memory, the dictionary must be
  // contiguous for open-vcdiff.
  bool open_dictionary(vcdiff_backend_ctx* p_ctx, source_reader& source, const uint8_t** dictionary_out) {
    const auto status = source.open();
    if (status != vcdiff_status_type_success) {
      vcdiff::backend_io::fail(p_ctx, status,
        status == vcdiff_status_type_unsuitable_source
          ? "open-vcdiff: source stream is not seekable"
          : "open-vcdiff: unable to read source size",
        source.last_errno());
      return false;
    }

    if (!source.map(dictionary_out)) {
      vcdiff::backend_io::fail(p_ctx, vcdiff_status_type_io_error,
        "open-vcdiff: unable to map source into memory", source.last_errno());
      return false;
    }

    return true;
  }

  int32_t openvcdiff_encode(vcdiff_backend_ctx* p_ctx) {
    if (!vcdiff::backend_io::validate_ctx(p_ctx)) {
      return 0;
    }

    source_reader source(p_ctx->source);
    const uint8_t* dictionary = nullptr;
    if (!open_dictionary(p_ctx, source, &dictionary)) {
      return 0;
    }

    open_vcdiff::HashedDictionary hashed_dictionary(reinterpret_cast<const char*>(dictionary),
      static_cast<size_t>(source.size()));
    if (!hashed_dictionary.Init()) {
      return vcdiff::backend_io::fail(p_ctx, vcdiff_status_type_error, "open-vcdiff: unable to hash source");
    }

    // Plain RFC 3284 output so any decoder can read the delta.
    open_vcdiff::VCDiffStreamingEncoder encoder(&hashed_dictionary, open_vcdiff::VCD_STANDARD_FORMAT, false);

    input_reader input(p_ctx->input);
    output_writer output(p_ctx->output, vcdiff::backend_io::output_is_stream(p_ctx));
    std::vector<uint8_t> block(vcdiff::backend_io::block_size);
    std::string produced;

    if (!encoder.StartEncoding(&produced)) {
      return vcdiff::backend_io::fail(p_ctx, vcdiff_status_type_error, "open-vcdiff: unable to start encoding");
    }

    while (!input.eof()) {
      size_t bytes_read = 0;
      if (!input.read(block.data(), block.size(), &bytes_read)) {
        return vcdiff::backend_io::fail(p_ctx, vcdiff_status_type_io_error,
          "open-vcdiff: unable to read target", input.last_errno());
      }

      if (bytes_read > 0
          && !encoder.EncodeChunk(reinterpret_cast<const char*>(block.data()), bytes_read, &produced)) {
        return vcdiff::backend_io::fail(p_ctx, vcdiff_status_type_error, "open-vcdiff: unable to encode target chunk");
      }

      if (!flush_output(output, produced)) {
        return vcdiff::backend_io::fail(p_ctx, write_failure_status(p_ctx),
          "open-vcdiff: unable to write delta", output.last_errno());
      }
    }

    if (!encoder.FinishEncoding(&produced)) {
      return vcdiff::backend_io::fail(p_ctx, vcdiff_status_type_error, "open-vcdiff: unable to finish encoding");
    }

    if (!flush_output(output, produced)) {
      return vcdiff::backend_io::fail(p_ctx, write_failure_status(p_ctx),
        "open-vcdiff: unable to write delta", output.last_errno());
    }

    if (!output.commit(p_ctx)) {
      return vcdiff::backend_io::fail(p_ctx, vcdiff_status_type_out_of_memory, "open-vcdiff: unable to allocate result");
    }

    p_ctx->status = vcdiff_status_type_success;
    return 1;
  }

  int32_t openvcdiff_decode(vcdiff_backend_ctx* p_ctx) {
    if (!vcdiff::backend_io::validate_ctx(p_ctx)) {
      return 0;
    }

    source_reader source(p_ctx->source);
    const uint8_t* dictionary = nullptr;
    if (!open_dictionary(p_ctx, source, &dictionary)) {
      return 0;
    }

    open_vcdiff::VCDiffStreamingDecoder decoder;
    decoder.StartDecoding(reinterpret_cast<const char*>(dictionary), static_cast<size_t>(source.size()));

    input_reader input(p_ctx->input);
    output_writer output(p_ctx->output, vcdiff::backend_io::output_is_stream(p_ctx));
    std::vector<uint8_t> block(vcdiff::backend_io::block_size);
    std::string produced;

    while (!input.eof()) {
      size_t bytes_read = 0;
      if (!input.read(block.data(), block.size(), &bytes_read)) {
        return vcdiff::backend_io::fail(p_ctx, vcdiff_status_type_io_error,
          "open-vcdiff: unable to read delta", input.last_errno());
      }

      if (bytes_read > 0
          && !decoder.DecodeChunk(reinterpret_cast<const char*>(block.data()), bytes_read, &produced)) {
        return vcdiff::backend_io::fail(p_ctx, vcdiff_status_type_corrupt_delta, "open-vcdiff: delta is not valid VCDIFF data");
      }

      if (!flush_output(output, produced)) {
        return vcdiff::backend_io::fail(p_ctx, write_failure_status(p_ctx),
          "open-vcdiff: unable to write target", output.last_errno());
      }
    }

    // Fails when the delta stops inside a window.
    if (!decoder.FinishDecoding()) {
      return vcdiff::backend_io::fail(p_ctx, vcdiff_status_type_corrupt_delta, "open-vcdiff: delta is truncated");
    }

    if (!output.commit(p_ctx)) {
      return vcdiff::backend_io::fail(p_ctx, vcdiff_status_type_out_of_memory, "open-vcdiff: unable to allocate result");
    }

    p_ctx->status = vcdiff_status_type_success;
    return 1;
  }

}

VCDIFF_API int32_t VCDIFF_CALLING_CONVENTION vcdiff_backend_diff(vcdiff_backend_ctx* p_ctx) {
  try {
    return openvcdiff_encode(p_ctx);
  } catch (const std::bad_alloc&) {
    vcdiff::backend_io::release(p_ctx);
    return vcdiff::backend_io::fail(p_ctx, vcdiff_status_type_out_of_memory, "open-vcdiff: out of memory");
  }
}

VCDIFF_API int32_t VCDIFF_CALLING_CONVENTION vcdiff_backend_patch(vcdiff_backend_ctx* p_ctx) {
  try {
    return openvcdiff_decode(p_ctx);
  } catch (const std::bad_alloc&) {
    vcdiff::backend_io::release(p_ctx);
    return vcdiff::backend_io::fail(p_ctx, vcdiff_status_type_out_of_memory, "open-vcdiff: out of memory");
  }
}

VCDIFF_API int32_t VCDIFF_CALLING_CONVENTION vcdiff_backend_free(vcdiff_backend_ctx* p_ctx) {
  return vcdiff::backend_io::release(p_ctx);
}
