// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "safetensors.h"

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <unordered_map>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "tensor.h"

/**
 * @brief Parsed SafeTensors header data.
 *
 * The SafeTensors file starts with an 8-byte little-endian unsigned integer
 * indicating the JSON header size in bytes, followed by the JSON header.
 */
struct sSafeTensorsHeader {
    std::uint64_t HeaderSize;
    nlohmann::json MetaData;
};

/**
 * @brief Read and parse the SafeTensors JSON header from a file.
 *
 * @param file_name Path to the `.safetensors` file.
 * @return A struct containing the header size (bytes) and parsed JSON metadata.
 *
 * @throws std::runtime_error If the file cannot be read or the header is invalid.
 */
static sSafeTensorsHeader read_safetensors_header(const std::string& file_name) {
    std::uint64_t header_size = 0;
    std::ifstream file(file_name, std::ios_base::binary);
    file.read(reinterpret_cast<char*>(&header_size), sizeof(header_size));
    if (!file) {
        throw std::runtime_error(fmt::format("Error opening safetensors file '{}'", file_name));
    }

    auto file_size = std::filesystem::file_size(file_name);
    if (header_size > file_size - sizeof(header_size)) {
        throw std::runtime_error(fmt::format("Corrupt safetensors header in '{}': header size {} exceeds file size {}",
                                             file_name, header_size, file_size));
    }

    std::vector<char> header(header_size, '\0');
    file.read(header.data(), static_cast<std::streamsize>(header_size));
    if (!file) {
        throw std::runtime_error(fmt::format("Truncated safetensors header in '{}'", file_name));
    }
    auto parsed = nlohmann::json::parse(header.begin(), header.end());
    return {header_size, std::move(parsed)};
}

/**
 * @brief Decode one floating point element of type @p dtype to float.
 */
static float load_as_float(const std::byte* src, ETensorDType dtype) {
    switch (dtype) {
        case ETensorDType::FP32: {
            float f;
            std::memcpy(&f, src, sizeof(f));
            return f;
        }
        case ETensorDType::BF16: {
            std::uint16_t h;
            std::memcpy(&h, src, sizeof(h));
            return bf16_bits_to_float(h);
        }
        case ETensorDType::FP16: {
            std::uint16_t h;
            std::memcpy(&h, src, sizeof(h));
            return fp16_bits_to_float(h);
        }
        default:
            throw std::logic_error(fmt::format("Cannot convert from {}", dtype_to_str(dtype)));
    }
}

static void store_from_float(std::byte* dst, float value, ETensorDType dtype) {
    switch (dtype) {
        case ETensorDType::FP32:
            std::memcpy(dst, &value, sizeof(value));
            return;
        case ETensorDType::BF16: {
            std::uint16_t h = float_to_bf16_bits(value);
            std::memcpy(dst, &h, sizeof(h));
            return;
        }
        case ETensorDType::FP16: {
            std::uint16_t h = float_to_fp16_bits(value);
            std::memcpy(dst, &h, sizeof(h));
            return;
        }
        default:
            throw std::logic_error(fmt::format("Cannot convert to {}", dtype_to_str(dtype)));
    }
}

SafeTensorEntry::SafeTensorEntry(const std::string& name, const std::vector<long>& shape, ETensorDType dtype,
                                 std::string file_name, std::ptrdiff_t data_begin, std::ptrdiff_t data_end)
    : mName(name), mShape(shape), mDType(dtype), mFileName(std::move(file_name)),
      mDataBegin(data_begin), mDataEnd(data_end) {
}

/**
 * @brief Read the full tensor for this entry into @p target, validating rank and shape.
 *
 * @param target Destination host tensor.
 * @param allow_cast Convert floating point entries whose dtype differs from the target.
 *
 * @throws std::runtime_error On rank/shape mismatch, dtype mismatch without @p allow_cast, or I/O errors.
 */
void SafeTensorEntry::read_tensor(Tensor& target, bool allow_cast) const {
    if (target.Rank != static_cast<int>(mShape.size()))
        throw std::runtime_error(fmt::format("Rank mismatch for tensor `{}`: expected {}, got {}",
                                             mName, mShape.size(), target.Rank));
    for (int i = 0; i < target.Rank; ++i)
        if (mShape[i] != target.Sizes[i])
            throw std::runtime_error(fmt::format("Shape mismatch for tensor `{}` at dim {}: expected {}, got {}",
                                                 mName, i, mShape[i], target.Sizes[i]));
    if (mDType != target.DType && !allow_cast)
        throw std::runtime_error(fmt::format("DType mismatch for tensor `{}`: target has {}, file has {}",
                                             mName, dtype_to_str(target.DType), dtype_to_str(mDType)));

    const std::size_t elements = target.nelem();
    const std::size_t src_size = get_dtype_size(mDType);
    const auto length = static_cast<std::streamsize>(elements * src_size);
    if (length != mDataEnd - mDataBegin)
        throw std::runtime_error(fmt::format("Corrupt entry `{}` in '{}': {} bytes for {} elements",
                                             mName, mFileName, mDataEnd - mDataBegin, elements));

    std::ifstream file(mFileName, std::ios_base::binary);
    file.seekg(mDataBegin);
    if (mDType == target.DType) {
        file.read(reinterpret_cast<char*>(target.Data), length);
    } else {
        std::vector<std::byte> buffer(static_cast<std::size_t>(length));
        file.read(reinterpret_cast<char*>(buffer.data()), length);
        const std::size_t dst_size = get_dtype_size(target.DType);
        for (std::size_t i = 0; i < elements; ++i) {
            store_from_float(target.Data + i * dst_size, load_as_float(buffer.data() + i * src_size, mDType), target.DType);
        }
    }
    if (!file)
        throw std::runtime_error(fmt::format("Error reading tensor `{}` from '{}'", mName, mFileName));
}

SafeTensorsReader::SafeTensorsReader(const std::string& file_name) {
    parse_single_file(file_name);
}

void SafeTensorsReader::parse_single_file(const std::string& file_path) {
    auto [HeaderSize, MetaData] = read_safetensors_header(file_path);
    std::ptrdiff_t offset = static_cast<std::ptrdiff_t>(HeaderSize + sizeof(HeaderSize));
    for (const auto& el : MetaData.items()) {
        const std::string& name = el.key();
        if (name == "__metadata__") {
            continue;
        }

        ETensorDType dtype = dtype_from_str(el.value()["dtype"].get<std::string>());
        auto shape = el.value()["shape"].get<std::vector<long>>();
        auto begin = el.value()["data_offsets"][0].get<std::ptrdiff_t>();
        auto end = el.value()["data_offsets"][1].get<std::ptrdiff_t>();

        mEntries.emplace_back(name, shape, dtype, file_path, begin + offset, end + offset);
    }
}

/**
 * @brief Load all tensors present in both the reader and the container.
 *
 * @throws std::runtime_error If a container tensor has no entry in the file, or on shape/dtype mismatch.
 */
void SafeTensorsReader::load_tensors(ITensorContainer& container, bool allow_cast) const {
    std::unordered_map<std::string, Tensor> named_tensors;
    container.iterate_tensors([&named_tensors](std::string name, const Tensor& tensor) {
        named_tensors.emplace(std::move(name), tensor);
    });

    std::size_t loaded = 0;
    for (const auto& entry : mEntries) {
        if (auto found = named_tensors.find(entry.name()); found != named_tensors.end()) {
            entry.read_tensor(found->second, allow_cast);
            ++loaded;
        }
    }
    if (loaded != named_tensors.size()) {
        for (const auto& [name, _] : named_tensors) {
            if (!has_entry(name))
                throw std::runtime_error(fmt::format("Missing tensor `{}` in safetensors file", name));
        }
    }
}

const SafeTensorEntry& SafeTensorsReader::find_entry(std::string_view name) const {
    for (auto& entry : mEntries)
        if (entry.name() == name)
            return entry;
    throw std::out_of_range(fmt::format("Entry not found: {}", name));
}

bool SafeTensorsReader::has_entry(std::string_view name) const {
    for (auto& entry : mEntries)
        if (entry.name() == name)
            return true;
    return false;
}

void load_safetensors(const std::string& file_name, ITensorContainer& tensors, bool allow_cast) {
    try {
        SafeTensorsReader reader(file_name);
        reader.load_tensors(tensors, allow_cast);
    } catch (std::exception& e) {
        throw std::runtime_error(fmt::format("Error loading safetensors file '{}': {}", file_name, e.what()));
    }
}

SafeTensorWriter::SafeTensorWriter(std::string file_name) : mFileName(std::move(file_name)) {
}

//! An uncommitted writer leaves no partial file behind.
SafeTensorWriter::~SafeTensorWriter() {
    if (!mCommitted) {
        std::error_code ec;
        std::filesystem::remove(mFileName + ".tmp", ec);
    }
}

void SafeTensorWriter::add(const std::string& name, const Tensor& tensor) {
    if (mCommitted)
        throw std::logic_error(fmt::format("Cannot add tensor `{}` to committed file '{}'", name, mFileName));
    if (!mTensors.emplace(name, tensor).second)
        throw std::logic_error(fmt::format("Duplicate tensor `{}` in '{}'", name, mFileName));
}

/**
 * @brief Write header and data of all added tensors, then move the file into place.
 *
 * Tensors are laid out in name order. The header is padded with spaces to a multiple of
 * eight bytes so that data offsets stay aligned.
 *
 * @throws std::runtime_error On I/O errors.
 */
void SafeTensorWriter::commit() {
    nlohmann::json header;
    header["__metadata__"] = {{"format", "pt"}, {"writer", "logsentinel"}};
    std::size_t offset = 0;
    for (const auto& [name, tensor] : mTensors) {
        header[name] = {{"dtype", dtype_to_str(tensor.DType)},
                        {"shape", tensor.shape()},
                        {"data_offsets", {offset, offset + tensor.bytes()}}};
        offset += tensor.bytes();
    }

    std::string text = header.dump();
    text.append((8 - text.size() % 8) % 8, ' ');
    const std::uint64_t header_size = text.size();

    const std::string temp_name = mFileName + ".tmp";
    {
        std::ofstream file(temp_name, std::ios_base::binary | std::ios_base::trunc);
        if (!file)
            throw std::runtime_error(fmt::format("Error opening '{}' for writing", temp_name));
        file.write(reinterpret_cast<const char*>(&header_size), sizeof(header_size));
        file.write(text.data(), static_cast<std::streamsize>(text.size()));
        for (const auto& [name, tensor] : mTensors) {
            file.write(reinterpret_cast<const char*>(tensor.Data), static_cast<std::streamsize>(tensor.bytes()));
        }
        file.flush();
        if (!file)
            throw std::runtime_error(fmt::format("Error writing safetensors file '{}'", temp_name));
    }
    std::filesystem::rename(temp_name, mFileName);
    mCommitted = true;
}

void write_safetensors(const std::string& file_name, ITensorContainer& tensors) {
    SafeTensorWriter writer(file_name);
    tensors.iterate_tensors([&writer](std::string name, const Tensor& tensor) {
        writer.add(name, tensor);
    });
    writer.commit();
}
