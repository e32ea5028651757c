// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "safetensors.h"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>

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
    /** @brief Size of the JSON header (bytes), not including this 8-byte length field. */
    std::uint64_t HeaderSize;
    /** @brief Parsed JSON metadata for all tensor entries and optional "__metadata__". */
    nlohmann::json MetaData;
};

namespace {

/**
 * @brief Read and parse the SafeTensors JSON header from a file.
 *
 * @param file_name Path to the `.safetensors` file.
 * @return A struct containing the header size (bytes) and parsed JSON metadata.
 *
 * @throws std::runtime_error If the file cannot be read or the header is invalid.
 */
sSafeTensorsHeader read_safetensors_header(const std::string& file_name) {
    std::uint64_t header_size = 0;
    std::ifstream file(file_name, std::ios_base::binary);
    file.read(reinterpret_cast<char*>(&header_size), sizeof(header_size));
    if (!file) {
        throw std::runtime_error("Error opening safetensors file '" + file_name + "'");
    }

    auto file_size = std::filesystem::file_size(file_name);
    if (header_size + sizeof(header_size) > file_size) {
        throw std::runtime_error(fmt::format("Corrupt safetensors file '{}': header of {} bytes exceeds file size {}",
                                             file_name, header_size, file_size));
    }

    std::vector<char> header(header_size, '\0');
    file.read(header.data(), static_cast<std::streamsize>(header_size));
    auto parsed = nlohmann::json::parse(header.begin(), header.end());
    return {header_size, std::move(parsed)};
}

//! Converts `count` elements between the float storage types.
void convert_elements(std::byte* dst, ETensorDType dst_type, const std::byte* src, ETensorDType src_type, std::size_t count) {
    for (std::size_t i = 0; i < count; ++i) {
        float value;
        if (src_type == ETensorDType::FP32) {
            std::memcpy(&value, src + i * sizeof(float), sizeof(float));
        } else if (src_type == ETensorDType::BF16) {
            bf16 v;
            std::memcpy(&v, src + i * sizeof(bf16), sizeof(bf16));
            value = static_cast<float>(v);
        } else {
            throw std::runtime_error(fmt::format("Cannot convert from {}", dtype_to_str(src_type)));
        }

        if (dst_type == ETensorDType::FP32) {
            std::memcpy(dst + i * sizeof(float), &value, sizeof(float));
        } else if (dst_type == ETensorDType::BF16) {
            bf16 v(value);
            std::memcpy(dst + i * sizeof(bf16), &v, sizeof(bf16));
        } else {
            throw std::runtime_error(fmt::format("Cannot convert to {}", dtype_to_str(dst_type)));
        }
    }
}

} // namespace

// SafeTensorEntry implementation

SafeTensorEntry::SafeTensorEntry(const std::string& name, const std::vector<long>& shape, ETensorDType dtype,
                                 std::string file_name, std::ptrdiff_t data_begin, std::ptrdiff_t data_end)
    : mName(name), mShape(shape), mDType(dtype), mFileName(std::move(file_name)),
      mDataBegin(data_begin), mDataEnd(data_end) {
}

/**
 * @brief Read a contiguous range of elements from this entry into a target tensor.
 *
 * Bounds are validated against the entry size, and the target tensor byte size
 * must match the requested element count at the target dtype.
 *
 * @param target Destination tensor (host memory) to fill.
 * @param offset Element offset (not bytes) from the start of this entry.
 * @param elements Number of elements to read.
 * @param allow_cast If true, allow dtype conversion from file dtype to target dtype.
 *
 * @throws std::runtime_error On invalid range, size mismatch, or dtype mismatch (if allow_cast is false).
 */
void SafeTensorEntry::read_raw(Tensor& target, std::ptrdiff_t offset,
                               std::ptrdiff_t elements, bool allow_cast) const {
    long nelem = static_cast<long>((mDataEnd - mDataBegin) / get_dtype_size(mDType));
    if (offset < 0 || offset + elements > nelem)
        throw std::runtime_error(fmt::format("Invalid read range: offset={}, elements={}, size={}",
                                             offset, elements, nelem));

    if (target.bytes() != elements * get_dtype_size(target.DType))
        throw std::runtime_error(fmt::format("Target tensor size mismatch for `{}`: has {} bytes, needs {} elements of {} bytes",
                                             mName, target.bytes(), elements, get_dtype_size(target.DType)));

    if (mDType != target.DType && !allow_cast)
        throw std::runtime_error(fmt::format("DType mismatch: tensor has {}, file has {}",
                                             dtype_to_str(target.DType), dtype_to_str(mDType)));

    std::ptrdiff_t start = mDataBegin + offset * static_cast<std::ptrdiff_t>(get_dtype_size(mDType));
    std::ptrdiff_t size = elements * static_cast<std::ptrdiff_t>(get_dtype_size(mDType));

    std::ifstream file(mFileName, std::ios_base::binary);
    file.seekg(start);
    if (mDType == target.DType) {
        file.read(reinterpret_cast<char*>(target.Data), size);
    } else {
        std::vector<std::byte> buffer(size);
        file.read(reinterpret_cast<char*>(buffer.data()), size);
        if (file) {
            convert_elements(target.Data, target.DType, buffer.data(), mDType, elements);
        }
    }
    if (!file) {
        throw std::runtime_error(fmt::format("Error reading tensor `{}` from '{}'", mName, mFileName));
    }
}

/**
 * @brief Read the full tensor for this entry into @p target, validating rank and shape.
 *
 * @throws std::runtime_error On rank/shape mismatch or dtype mismatch (if allow_cast is false).
 */
void SafeTensorEntry::read_tensor(Tensor& target, bool allow_cast) const {
    if (target.Rank != static_cast<int>(mShape.size()))
        throw std::runtime_error(fmt::format("Rank mismatch for tensor `{}`: expected {}, got {}",
                                             mName, mShape.size(), target.Rank));

    for (int i = 0; i < target.Rank; ++i)
        if (mShape[i] != target.Sizes[i])
            throw std::runtime_error(fmt::format("Shape mismatch for tensor `{}` at dim {}: expected {}, got {}",
                                                 mName, i, mShape[i], target.Sizes[i]));
    read_raw(target, 0, static_cast<std::ptrdiff_t>(target.nelem()), allow_cast);
}

// SafeTensorsReader implementation

/**
 * @brief Construct a reader for a single `.safetensors` file.
 *
 * Reads the JSON header and computes the absolute data offsets (including the
 * header length field and JSON header) of every entry.
 *
 * @throws std::runtime_error / nlohmann::json exceptions on I/O or parse failures.
 */
SafeTensorsReader::SafeTensorsReader(const std::string& file_name) {
    auto [HeaderSize, MetaData] = read_safetensors_header(file_name);
    std::ptrdiff_t offset = static_cast<std::ptrdiff_t>(HeaderSize + sizeof(HeaderSize));
    for (const auto& el : MetaData.items()) {
        const std::string& name = el.key();
        if (name == "__metadata__") {
            for (const auto& meta : el.value().items()) {
                if (meta.value().is_string()) {
                    mMetaData[meta.key()] = meta.value().get<std::string>();
                }
            }
            continue;
        }

        ETensorDType dtype = dtype_from_str(el.value()["dtype"].get<std::string_view>());
        auto shape = el.value()["shape"].get<std::vector<long>>();
        auto begin = el.value()["data_offsets"][0].get<std::ptrdiff_t>();
        auto end = el.value()["data_offsets"][1].get<std::ptrdiff_t>();

        mEntries.emplace_back(name, shape, dtype, file_name, begin + offset, end + offset);
    }
}

void SafeTensorsReader::load_tensors(ITensorContainer& container, bool allow_cast) const {
    container.iterate_tensors([&](std::string name, const TensorShard& tensor) {
        Tensor target = tensor;
        find_entry(name).read_tensor(target, allow_cast);
    });
}

const SafeTensorEntry& SafeTensorsReader::find_entry(std::string_view name) const {
    auto found = std::find_if(mEntries.begin(), mEntries.end(), [&](const SafeTensorEntry& e) { return e.name() == name; });
    if (found == mEntries.end()) {
        throw std::out_of_range(fmt::format("Tensor `{}` not found in safetensors file", name));
    }
    return *found;
}

void load_safetensors(const std::string& file_name, ITensorContainer& tensors, bool allow_cast) {
    SafeTensorsReader reader{file_name};
    reader.load_tensors(tensors, allow_cast);
}

// SafeTensorWriter implementation

SafeTensorWriter::SafeTensorWriter(std::string file_name) : mFileName(std::move(file_name)) {
}

/**
 * @brief Removes a leftover temporary file if finalize() did not complete.
 */
SafeTensorWriter::~SafeTensorWriter() {
    if (!mFinished) {
        std::error_code ec;
        std::filesystem::remove(mFileName + ".tmp", ec);
    }
}

/**
 * @brief Register a tensor for writing; assigns its byte range in the data section.
 *
 * @throws std::logic_error If metadata is already finalized or the name is taken.
 */
void SafeTensorWriter::register_tensor(const std::string& name, const TensorShard& tensor) {
    if (mMetaFinalized)
        throw std::logic_error("Cannot register tensor " + name + " after metadata has been finalized");
    if (mRegisteredTensors.contains(name))
        throw std::logic_error("Tensor " + name + " registered twice");

    std::vector<long> shape(tensor.GlobalShape.begin(), tensor.GlobalShape.begin() + tensor.Rank);
    std::ptrdiff_t size = static_cast<std::ptrdiff_t>(tensor.global_nelem() * get_dtype_size(tensor.DType));
    mRegisteredTensors.emplace(name, sEntry{tensor.DType, std::move(shape), mDataSize, size});
    mOrder.push_back(name);
    mDataSize += size;
}

void SafeTensorWriter::set_metadata(const std::string& key, const std::string& value) {
    if (mMetaFinalized)
        throw std::logic_error("Cannot set metadata after it has been finalized");
    mUserMeta[key] = value;
}

/**
 * @brief Serialize the JSON header and allocate the output buffer.
 *
 * The header is padded with spaces to a multiple of 8 bytes so that tensor data stays aligned.
 */
void SafeTensorWriter::prepare_metadata() {
    nlohmann::json meta_data;
    nlohmann::json meta = nlohmann::json::object({{"format", "pt"}, {"writer", "halo"}});
    for (const auto& [key, value] : mUserMeta) {
        meta[key] = value;
    }
    meta_data["__metadata__"] = meta;
    for (const auto& name : mOrder) {
        const auto& entry = mRegisteredTensors.at(name);
        meta_data[name] = {{"dtype", dtype_to_str(entry.DType)},
                           {"shape", entry.Shape},
                           {"data_offsets", {entry.Begin, entry.Begin + entry.Size}}};
    }

    std::string header = meta_data.dump();
    while (header.size() % 8 != 0) {
        header.push_back(' ');
    }

    std::uint64_t header_size = header.size();
    mHeaderSize = static_cast<std::ptrdiff_t>(sizeof(header_size) + header.size());
    mBuffer.resize(mHeaderSize + mDataSize);
    std::memcpy(mBuffer.data(), &header_size, sizeof(header_size));
    std::memcpy(mBuffer.data() + sizeof(header_size), header.data(), header.size());
    mMetaFinalized = true;
}

/**
 * @brief Copy the data of a registered tensor into the output.
 *
 * @throws std::logic_error If metadata is not finalized, the tensor was already written or is sharded, or on dtype mismatch.
 * @throws std::out_of_range If @p name was not registered.
 */
void SafeTensorWriter::write_tensor(const std::string& name, const TensorShard& tensor) {
    if (!mMetaFinalized)
        throw std::logic_error("Cannot write tensor before metadata has been finalized");

    auto found = mRegisteredTensors.find(name);
    if (found == mRegisteredTensors.end())
        throw std::out_of_range("Invalid tensor " + name);

    if (found->second.Done)
        throw std::logic_error("Tensor " + name + " has already been written");

    if (found->second.DType != tensor.DType)
        throw std::logic_error(fmt::format("DType mismatch for tensor `{}`: registered as {}, writing as {}",
                                           name, dtype_to_str(found->second.DType), dtype_to_str(tensor.DType)));

    if (tensor.NumShards != 1)
        throw std::logic_error("Cannot write sharded tensor " + name + "; gather it first");

    std::memcpy(mBuffer.data() + found->second.Begin + mHeaderSize, tensor.Data, tensor.bytes());
    found->second.Done = true;
}

/**
 * @brief Verify all tensors are written, write `<file>.tmp` and rename it to the final name.
 *
 * @throws std::logic_error If any registered tensor has not been written.
 * @throws std::runtime_error On I/O failure.
 */
void SafeTensorWriter::finalize() {
    if (!mMetaFinalized)
        prepare_metadata();

    for (auto& [name, tensor] : mRegisteredTensors)
        if (!tensor.Done)
            throw std::logic_error("Tensor " + name + " has not been written");

    std::string temp_name = mFileName + ".tmp";
    {
        std::ofstream file(temp_name, std::ios_base::binary | std::ios_base::trunc);
        file.write(reinterpret_cast<const char*>(mBuffer.data()), static_cast<std::streamsize>(mBuffer.size()));
        file.flush();
        if (!file) {
            throw std::runtime_error("Error writing safetensors file '" + temp_name + "'");
        }
    }
    std::filesystem::rename(temp_name, mFileName);
    mFinished = true;
}

/**
 * @brief Convenience function to write all tensors from a container into a SafeTensors file.
 *
 * Registers all tensors, writes metadata, writes each tensor in full, then finalizes.
 */
void write_safetensors(const std::string& file_name, ITensorContainer& tensors) {
    SafeTensorWriter writer{file_name};
    tensors.iterate_tensors([&writer](std::string name, const TensorShard& tensor) {
        writer.register_tensor(name, tensor);
    });
    writer.prepare_metadata();
    tensors.iterate_tensors([&writer](std::string name, const TensorShard& tensor) {
        writer.write_tensor(name, tensor);
    });
    writer.finalize();
}
