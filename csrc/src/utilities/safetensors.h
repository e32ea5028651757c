// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef HALO_SRC_UTILS_SAFETENSORS_H
#define HALO_SRC_UTILS_SAFETENSORS_H

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "dtype.h"
#include "tensor_container.h"

struct Tensor;
class TensorShard;

class SafeTensorEntry {
public:
    SafeTensorEntry(const std::string& name, const std::vector<long>& shape, ETensorDType dtype,
                    std::string file_name, std::ptrdiff_t data_begin, std::ptrdiff_t data_end);

    [[nodiscard]] const std::string& name() const { return mName; }
    [[nodiscard]] const std::vector<long>& shape() const { return mShape; }
    [[nodiscard]] ETensorDType dtype() const { return mDType; }

    void read_tensor(Tensor& target, bool allow_cast) const;
    void read_raw(Tensor& target, std::ptrdiff_t offset, std::ptrdiff_t elements, bool allow_cast) const;

private:
    std::string mName;
    std::vector<long> mShape;
    ETensorDType mDType;
    std::string mFileName;
    std::ptrdiff_t mDataBegin;
    std::ptrdiff_t mDataEnd;
};

class SafeTensorsReader {
public:
    explicit SafeTensorsReader(const std::string& file_name);

    //! Fills every tensor of the container from the entry of the same name.
    void load_tensors(ITensorContainer& container, bool allow_cast) const;

    [[nodiscard]] const SafeTensorEntry& find_entry(std::string_view name) const;
    [[nodiscard]] const std::vector<SafeTensorEntry>& entries() const { return mEntries; }
    //! string-valued entries of the "__metadata__" header object
    [[nodiscard]] const std::unordered_map<std::string, std::string>& metadata() const { return mMetaData; }

private:
    std::vector<SafeTensorEntry> mEntries;
    std::unordered_map<std::string, std::string> mMetaData;
};

//! \brief Writes a safetensors file. Data goes to `<file>.tmp`, which is renamed on finalize().
class SafeTensorWriter {
public:
    explicit SafeTensorWriter(std::string file_name);
    ~SafeTensorWriter();

    SafeTensorWriter(const SafeTensorWriter&) = delete;
    SafeTensorWriter& operator=(const SafeTensorWriter&) = delete;

    void register_tensor(const std::string& name, const TensorShard& tensor);
    void set_metadata(const std::string& key, const std::string& value);
    void prepare_metadata();
    void write_tensor(const std::string& name, const TensorShard& tensor);
    void finalize();

private:
    struct sEntry {
        ETensorDType DType;
        std::vector<long> Shape;
        std::ptrdiff_t Begin;
        std::ptrdiff_t Size;
        bool Done = false;
    };

    std::string mFileName;
    std::unordered_map<std::string, sEntry> mRegisteredTensors;
    std::vector<std::string> mOrder;
    std::unordered_map<std::string, std::string> mUserMeta;
    std::vector<std::byte> mBuffer;
    std::ptrdiff_t mHeaderSize = 0;
    std::ptrdiff_t mDataSize = 0;
    bool mMetaFinalized = false;
    bool mFinished = false;
};

void load_safetensors(const std::string& file_name, ITensorContainer& tensors, bool allow_cast);
void write_safetensors(const std::string& file_name, ITensorContainer& tensors);

#endif //HALO_SRC_UTILS_SAFETENSORS_H
