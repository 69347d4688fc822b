#include "tests/harness.hpp"
#include "tests/support/this_exe.hpp"
#include "tests/support/utils.hpp"

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>
#include <stdexcept>

using vcdiff::support::util::temp_file;

namespace vcdiff
{
    namespace tests
    {
        namespace
        {
            constexpr const char* test_backend_id = "vcdiff/test";

            bytes to_bytes(const std::string& str)
            {
                return bytes(str.begin(), str.end());
            }

            bytes random_bytes(const size_t size, const uint32_t seed)
            {
                std::mt19937 rng(seed);
                bytes data(size);
                for (auto& b : data)
                {
                    b = static_cast<uint8_t>(rng() & 0xff);
                }
                return data;
            }

            // Overwrites, inserts and deletes a few spans at fixed positions.
            bytes scatter_edits(bytes data, const uint32_t seed)
            {
                std::mt19937 rng(seed);
                const auto step = data.size() / 8;
                for (size_t i = 1; i < 8; ++i)
                {
                    const auto pos = i * step;
                    switch (i % 3)
                    {
                    case 0:
                        for (size_t j = 0; j < 64 && pos + j < data.size(); ++j)
                        {
                            data[pos + j] = static_cast<uint8_t>(rng() & 0xff);
                        }
                        break;
                    case 1:
                    {
                        const auto insert = random_bytes(128, seed + static_cast<uint32_t>(i));
                        data.insert(data.begin() + static_cast<std::ptrdiff_t>(pos), insert.begin(), insert.end());
                        break;
                    }
                    default:
                        data.erase(data.begin() + static_cast<std::ptrdiff_t>(pos),
                            data.begin() + static_cast<std::ptrdiff_t>(pos + 96));
                        break;
                    }
                }
                return data;
            }

            bytes repeated_blocks(const size_t block_count)
            {
                const auto block = random_bytes(4096, 7);
                bytes data;
                for (size_t i = 0; i < block_count; ++i)
                {
                    data.insert(data.end(), block.begin(), block.end());
                }
                return data;
            }

            std::vector<test_case> build_corpus()
            {
                std::vector<test_case> cases;

                cases.push_back({ "hello_world", to_bytes("hello"), to_bytes("hello world") });
                cases.push_back({ "empty_source", bytes(), to_bytes("hello world") });
                cases.push_back({ "empty_target", to_bytes("hello world"), bytes() });
                cases.push_back({ "identical", to_bytes("the same bytes on both sides"), to_bytes("the same bytes on both sides") });
                cases.push_back({ "prefix_edit", to_bytes("quick brown fox jumps over the lazy dog"), to_bytes("The quick brown fox jumps over the lazy dog") });
                cases.push_back({ "suffix_edit", to_bytes("quick brown fox jumps over the lazy dog"), to_bytes("quick brown fox jumps over the lazy cat!") });

                const bytes binary_source = { 0x00, 0x01, 0x00, 0xff, 0x00, 0x00, 0x7f, 0x80, 0x00, 0x0a, 0x0d, 0x00 };
                bytes binary_target = binary_source;
                binary_target.insert(binary_target.begin() + 4, { 0x00, 0x00, 0xfe });
                binary_target.push_back(0x00);
                cases.push_back({ "binary_nul", binary_source, binary_target });

                const auto blocks = repeated_blocks(32);
                auto blocks_target = blocks;
                blocks_target.insert(blocks_target.end(), blocks.begin(), blocks.begin() + 8192);
                cases.push_back({ "repeated_blocks", blocks, blocks_target });

                const auto random_64k = random_bytes(64 * 1024, 42);
                cases.push_back({ "random_64k", random_64k, scatter_edits(random_64k, 43) });

                const auto random_1m = random_bytes(1024 * 1024, 1024);
                cases.push_back({ "random_1m", random_1m, scatter_edits(random_1m, 1025) });

                cases.push_back({ "unrelated", random_bytes(10000, 1), random_bytes(12000, 2) });

                return cases;
            }

            std::vector<combination> build_combinations()
            {
                std::vector<combination> all;
                for (auto i = 0; i < 8; ++i)
                {
                    all.push_back({ (i & 4) != 0, (i & 2) != 0, (i & 1) != 0 });
                }
                return all;
            }

            // Runs one call with endpoints set up as described by how.
            template<typename Fn>
            bytes run(const bytes& source, const bytes& input, const combination& how, Fn&& fn)
            {
                std::unique_ptr<temp_file> source_file;
                std::unique_ptr<temp_file> input_file;
                std::unique_ptr<temp_file> output_file;

                auto source_endpoint = endpoint::from_buffer(source);
                if (how.source_stream)
                {
                    source_file = std::make_unique<temp_file>(source);
                    if (!source_file->is_open())
                    {
                        throw std::runtime_error("Unable to create source file " + source_file->filename());
                    }
                    source_endpoint = endpoint::from_stream(source_file->fd(), endpoint_role::source);
                }

                auto input_endpoint = endpoint::from_buffer(input);
                if (how.input_stream)
                {
                    input_file = std::make_unique<temp_file>(input);
                    if (!input_file->is_open())
                    {
                        throw std::runtime_error("Unable to create input file " + input_file->filename());
                    }
                    input_endpoint = endpoint::from_stream(input_file->fd(), endpoint_role::input);
                }

                if (!how.output_stream)
                {
                    return fn(source_endpoint, input_endpoint, nullptr);
                }

                output_file = std::make_unique<temp_file>(bytes());
                if (!output_file->is_open())
                {
                    throw std::runtime_error("Unable to create output file " + output_file->filename());
                }
                const auto output_endpoint = endpoint::from_stream(output_file->fd(), endpoint_role::output);
                fn(source_endpoint, input_endpoint, &output_endpoint);

                return output_file->read_all();
            }
        }

        std::string combination::code() const
        {
            std::string code;
            code += source_stream ? 'S' : 'M';
            code += input_stream ? 'S' : 'M';
            code += output_stream ? 'S' : 'M';
            return code;
        }

        const std::vector<test_case>& corpus()
        {
            static const auto cases = build_corpus();
            return cases;
        }

        const std::vector<combination>& combinations()
        {
            static const auto all = build_combinations();
            return all;
        }

        registry& harness_registry()
        {
            static auto* const r = []
            {
                registry_options options;
                options.module_directory = this_exe::get_module_directory();
                return new registry(options);
            }();
            return *r;
        }

        std::vector<std::string> installed_backends(const bool include_test_backend)
        {
            std::vector<std::string> ids;

            auto& r = harness_registry();
            for (const auto& candidate : r.options().candidates)
            {
                try
                {
                    r.load(candidate);
                    ids.push_back(candidate);
                }
                catch (const backend_load_error& e)
                {
                    LOGI << "Backend not installed, not testing it: " << e.what();
                }
            }

            if (include_test_backend)
            {
                ids.emplace_back(test_backend_id);
            }

            return ids;
        }

        bytes run_diff(backend& backend, const bytes& source, const bytes& target, const combination& how)
        {
            return run(source, target, how, [&backend](const endpoint& s, const endpoint& t, const endpoint* o)
            {
                if (o == nullptr)
                {
                    return backend.diff(s, t);
                }
                backend.diff(s, t, *o);
                return bytes();
            });
        }

        bytes run_patch(backend& backend, const bytes& source, const bytes& delta, const combination& how)
        {
            return run(source, delta, how, [&backend](const endpoint& s, const endpoint& d, const endpoint* o)
            {
                if (o == nullptr)
                {
                    return backend.patch(s, d);
                }
                backend.patch(s, d, *o);
                return bytes();
            });
        }

        std::string test_name_part(const std::string& id)
        {
            std::string name;
            if (!parse_backend_id(id, nullptr, &name))
            {
                name = id;
            }

            for (auto& c : name)
            {
                if (!std::isalnum(static_cast<unsigned char>(c)))
                {
                    c = '_';
                }
            }
            return name;
        }
    }
}
