#include "vcdiff/abi.h"
#include "backend/io.hpp"

#include <xdelta3.h>

#include <cstring>
#include <new>
#include <string>
#include <vector>

using vcdiff::backend_io::input_reader;
using vcdiff::backend_io::output_writer;
using vcdiff::backend_io::source_reader;

namespace {

  enum class xdelta3_mode {
    encode,
    decode
  };

  const char* to_string(const xdelta3_mode mode) {
    return mode == xdelta3_mode::encode ? "encode" : "decode";
  }

  vcdiff_status_type map_xd3_error(const int ret, const xdelta3_mode mode) {
    switch (ret) {
      case ENOMEM:
        return vcdiff_status_type_out_of_memory;
      case XD3_INVALID_INPUT:
        return mode == xdelta3_mode::decode ? vcdiff_status_type_corrupt_delta : vcdiff_status_type_error;
      case XD3_INVALID:
        return vcdiff_status_type_invalid_arg;
      case XD3_TOOFARBACK:
        return vcdiff_status_type_size_too_large;
      default:
        return vcdiff_status_type_error;
    }
  }

  std::string xd3_message(xd3_stream* stream, const int ret, const xdelta3_mode mode) {
    const char* msg = xd3_errstring(stream);
    std::string message = std::string("xdelta3 ") + to_string(mode) + " failed: ";
    message += msg != nullptr && msg[0] != '\0' ? msg : xd3_strerror(ret);
    return message;
  }

  // Serves one source block requested by the stream.
  bool read_source_block(source_reader& source, xd3_source& xd3_src, std::vector<uint8_t>& block) {
    const uint64_t offset = static_cast<uint64_t>(xd3_src.getblkno) * xd3_src.blksize;
    size_t bytes_read = 0;
    if (!source.read_at(offset, block.data(), block.size(), &bytes_read)) {
      return false;
    }
    xd3_src.curblkno = xd3_src.getblkno;
    xd3_src.curblk = block.data();
    xd3_src.onblk = static_cast<usize_t>(bytes_read);
    return true;
  }

  int32_t xdelta3_run(vcdiff_backend_ctx* p_ctx, const xdelta3_mode mode) {
    if (!vcdiff::backend_io::validate_ctx(p_ctx)) {
      return 0;
    }

    source_reader source(p_ctx->source);
    const auto source_status = source.open();
    if (source_status != vcdiff_status_type_success) {
      return vcdiff::backend_io::fail(p_ctx, source_status,
        source_status == vcdiff_status_type_unsuitable_source
          ? "xdelta3: source stream is not seekable"
          : "xdelta3: unable to read source size",
        source.last_errno());
    }

    input_reader input(p_ctx->input);
    output_writer output(p_ctx->output, vcdiff::backend_io::output_is_stream(p_ctx));

    std::vector<uint8_t> input_block;
    std::vector<uint8_t> source_block;
    try {
      input_block.resize(vcdiff::backend_io::block_size);
      source_block.resize(vcdiff::backend_io::block_size);
    } catch (const std::bad_alloc&) {
      return vcdiff::backend_io::fail(p_ctx, vcdiff_status_type_out_of_memory, "xdelta3: out of memory");
    }

    xd3_stream stream;
    xd3_config config;
    xd3_source xd3_src;
    std::memset(&stream, 0, sizeof(stream));
    std::memset(&xd3_src, 0, sizeof(xd3_src));

    xd3_init_config(&config, 0);

    int ret = xd3_config_stream(&stream, &config);
    vcdiff_status_type status = vcdiff_status_type_success;
    std::string message;

    if (ret != 0) {
      status = map_xd3_error(ret, mode);
      message = xd3_message(&stream, ret, mode);
      goto cleanup;
    }

    // An empty source is left out, the delta then only uses add and run.
    if (source.size() > 0) {
      xd3_src.blksize = static_cast<usize_t>(vcdiff::backend_io::block_size);
      xd3_src.getblkno = 0;
      if (!read_source_block(source, xd3_src, source_block)) {
        status = vcdiff_status_type_io_error;
        message = vcdiff::backend_io::with_error_number("xdelta3: unable to read source", source.last_errno());
        goto cleanup;
      }

      if ((ret = xd3_set_source_and_size(&stream, &xd3_src, static_cast<xoff_t>(source.size()))) != 0) {
        status = map_xd3_error(ret, mode);
        message = xd3_message(&stream, ret, mode);
        goto cleanup;
      }
    }

    {
      bool done = false;
      while (!done) {
        size_t bytes_read = 0;
        if (!input.read(input_block.data(), input_block.size(), &bytes_read)) {
          status = vcdiff_status_type_io_error;
          message = vcdiff::backend_io::with_error_number(
            mode == xdelta3_mode::encode ? "xdelta3: unable to read target" : "xdelta3: unable to read delta",
            input.last_errno());
          goto cleanup;
        }

        if (input.eof()) {
          xd3_set_flags(&stream, XD3_FLUSH | stream.flags);
        }

        xd3_avail_input(&stream, input_block.data(), static_cast<usize_t>(bytes_read));

        bool need_input = false;
        while (!need_input) {
          ret = mode == xdelta3_mode::encode ? xd3_encode_input(&stream) : xd3_decode_input(&stream);

          switch (ret) {
            case XD3_INPUT:
              need_input = true;
              break;
            case XD3_OUTPUT:
              if (!output.write(stream.next_out, stream.avail_out)) {
                status = vcdiff::backend_io::output_is_stream(p_ctx)
                  ? vcdiff_status_type_io_error
                  : vcdiff_status_type_out_of_memory;
                message = vcdiff::backend_io::with_error_number("xdelta3: unable to write output", output.last_errno());
                goto cleanup;
              }
              xd3_consume_output(&stream);
              break;
            case XD3_GETSRCBLK:
              if (!read_source_block(source, xd3_src, source_block)) {
                status = vcdiff_status_type_io_error;
                message = vcdiff::backend_io::with_error_number(
                  "xdelta3: unable to read source block " + std::to_string(xd3_src.getblkno), source.last_errno());
                goto cleanup;
              }
              break;
            case XD3_GOTHEADER:
            case XD3_WINSTART:
            case XD3_WINFINISH:
              break;
            default:
              status = map_xd3_error(ret, mode);
              message = xd3_message(&stream, ret, mode);
              goto cleanup;
          }
        }

        done = input.eof();
      }
    }

    // A delta that ends inside a window is reported here.
    if ((ret = xd3_close_stream(&stream)) != 0) {
      status = map_xd3_error(ret, mode);
      message = xd3_message(&stream, ret, mode);
      goto cleanup;
    }

    if (!output.commit(p_ctx)) {
      status = vcdiff_status_type_out_of_memory;
      message = "xdelta3: unable to allocate result";
    }

cleanup:
    xd3_free_stream(&stream);

    if (status != vcdiff_status_type_success) {
      vcdiff::backend_io::release(p_ctx);
      return vcdiff::backend_io::fail(p_ctx, status, message);
    }

    p_ctx->status = vcdiff_status_type_success;
    return 1;
  }

}

VCDIFF_API int32_t VCDIFF_CALLING_CONVENTION vcdiff_backend_diff(vcdiff_backend_ctx* p_ctx) {
  try {
    return xdelta3_run(p_ctx, xdelta3_mode::encode);
  } catch (const std::bad_alloc&) {
    vcdiff::backend_io::release(p_ctx);
    return vcdiff::backend_io::fail(p_ctx, vcdiff_status_type_out_of_memory, "xdelta3: out of memory");
  }
}

VCDIFF_API int32_t VCDIFF_CALLING_CONVENTION vcdiff_backend_patch(vcdiff_backend_ctx* p_ctx) {
  try {
    return xdelta3_run(p_ctx, xdelta3_mode::decode);
  } catch (const std::bad_alloc&) {
    vcdiff::backend_io::release(p_ctx);
    return vcdiff::backend_io::fail(p_ctx, vcdiff_status_type_out_of_memory, "xdelta3: out of memory");
  }
}

VCDIFF_API int32_t VCDIFF_CALLING_CONVENTION vcdiff_backend_free(vcdiff_backend_ctx* p_ctx) {
  return vcdiff::backend_io::release(p_ctx);
}
