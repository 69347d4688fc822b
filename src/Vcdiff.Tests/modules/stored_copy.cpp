#include "vcdiff/abi.h"
#include "backend/io.hpp"

#include <cstring>
#include <new>
#include <string>
#include <vector>

// vcdiff/test: stores the target verbatim behind a small header. Only
// useful for exercising the host without a codec library installed.
//
// Delta layout: "VTST", source size as 8 byte little endian, target bytes.

using vcdiff::backend_io::input_reader;
using vcdiff::backend_io::output_writer;
using vcdiff::backend_io::source_reader;

namespace {

  constexpr char stored_copy_magic[] = { 'V', 'T', 'S', 'T' };
  constexpr size_t stored_copy_header_size = sizeof(stored_copy_magic) + sizeof(uint64_t);

  bool open_source(vcdiff_backend_ctx* p_ctx, source_reader& source) {
    const auto status = source.open();
    if (status == vcdiff_status_type_success) {
      return true;
    }

    vcdiff::backend_io::fail(p_ctx, status,
      status == vcdiff_status_type_unsuitable_source
        ? "vcdiff/test: source stream is not seekable"
        : "vcdiff/test: unable to read source size",
      source.last_errno());
    return false;
  }

  // Copies the rest of the input to the output.
  bool copy_input(input_reader& input, output_writer& output, std::string* error_out) {
    std::vector<uint8_t> block(vcdiff::backend_io::block_size);
    while (!input.eof()) {
      size_t bytes_read = 0;
      if (!input.read(block.data(), block.size(), &bytes_read)) {
        *error_out = vcdiff::backend_io::with_error_number("vcdiff/test: unable to read input", input.last_errno());
        return false;
      }
      if (!output.write(block.data(), bytes_read)) {
        *error_out = vcdiff::backend_io::with_error_number("vcdiff/test: unable to write output", output.last_errno());
        return false;
      }
    }
    return true;
  }

  int32_t stored_copy_diff(vcdiff_backend_ctx* p_ctx) {
    if (!vcdiff::backend_io::validate_ctx(p_ctx)) {
      return 0;
    }

    source_reader source(p_ctx->source);
    if (!open_source(p_ctx, source)) {
      return 0;
    }

    uint8_t header[stored_copy_header_size];
    std::memcpy(header, stored_copy_magic, sizeof(stored_copy_magic));
    const auto source_size = source.size();
    for (size_t i = 0; i < sizeof(uint64_t); ++i) {
      header[sizeof(stored_copy_magic) + i] = static_cast<uint8_t>(source_size >> (8 * i));
    }

    input_reader input(p_ctx->input);
    output_writer output(p_ctx->output, vcdiff::backend_io::output_is_stream(p_ctx));

    if (!output.write(header, sizeof(header))) {
      return vcdiff::backend_io::fail(p_ctx, vcdiff_status_type_io_error,
        "vcdiff/test: unable to write output", output.last_errno());
    }

    std::string error;
    if (!copy_input(input, output, &error)) {
      return vcdiff::backend_io::fail(p_ctx, vcdiff_status_type_io_error, error);
    }

    if (!output.commit(p_ctx)) {
      return vcdiff::backend_io::fail(p_ctx, vcdiff_status_type_out_of_memory,
        "vcdiff/test: unable to allocate result", output.last_errno());
    }

    p_ctx->status = vcdiff_status_type_success;
    return 1;
  }

  int32_t stored_copy_patch(vcdiff_backend_ctx* p_ctx) {
    if (!vcdiff::backend_io::validate_ctx(p_ctx)) {
      return 0;
    }

    source_reader source(p_ctx->source);
    if (!open_source(p_ctx, source)) {
      return 0;
    }

    input_reader input(p_ctx->input);

    uint8_t header[stored_copy_header_size];
    size_t bytes_read = 0;
    if (!input.read(header, sizeof(header), &bytes_read)) {
      return vcdiff::backend_io::fail(p_ctx, vcdiff_status_type_io_error,
        "vcdiff/test: unable to read delta", input.last_errno());
    }

    if (bytes_read != sizeof(header)
        || std::memcmp(header, stored_copy_magic, sizeof(stored_copy_magic)) != 0) {
      return vcdiff::backend_io::fail(p_ctx, vcdiff_status_type_corrupt_delta, "vcdiff/test: delta header is missing");
    }

    uint64_t expected_source_size = 0;
    for (size_t i = 0; i < sizeof(uint64_t); ++i) {
      expected_source_size |= static_cast<uint64_t>(header[sizeof(stored_copy_magic) + i]) << (8 * i);
    }

    if (expected_source_size != source.size()) {
      return vcdiff::backend_io::fail(p_ctx, vcdiff_status_type_corrupt_delta,
        "vcdiff/test: delta was made for a source of " + std::to_string(expected_source_size)
          + " bytes, got " + std::to_string(source.size()));
    }

    output_writer output(p_ctx->output, vcdiff::backend_io::output_is_stream(p_ctx));

    std::string error;
    if (!copy_input(input, output, &error)) {
      return vcdiff::backend_io::fail(p_ctx, vcdiff_status_type_io_error, error);
    }

    if (!output.commit(p_ctx)) {
      return vcdiff::backend_io::fail(p_ctx, vcdiff_status_type_out_of_memory,
        "vcdiff/test: unable to allocate result", output.last_errno());
    }

    p_ctx->status = vcdiff_status_type_success;
    return 1;
  }

}

VCDIFF_API int32_t VCDIFF_CALLING_CONVENTION vcdiff_backend_diff(vcdiff_backend_ctx* p_ctx) {
  try {
    return stored_copy_diff(p_ctx);
  } catch (const std::bad_alloc&) {
    vcdiff::backend_io::release(p_ctx);
    return vcdiff::backend_io::fail(p_ctx, vcdiff_status_type_out_of_memory, "vcdiff/test: out of memory");
  }
}

VCDIFF_API int32_t VCDIFF_CALLING_CONVENTION vcdiff_backend_patch(vcdiff_backend_ctx* p_ctx) {
  try {
    return stored_copy_patch(p_ctx);
  } catch (const std::bad_alloc&) {
    vcdiff::backend_io::release(p_ctx);
    return vcdiff::backend_io::fail(p_ctx, vcdiff_status_type_out_of_memory, "vcdiff/test: out of memory");
  }
}

VCDIFF_API int32_t VCDIFF_CALLING_CONVENTION vcdiff_backend_free(vcdiff_backend_ctx* p_ctx) {
  return vcdiff::backend_io::release(p_ctx);
}
