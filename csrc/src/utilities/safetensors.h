// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOGSENTINEL_SRC_UTILITIES_SAFETENSORS_H
#define LOGSENTINEL_SRC_UTILITIES_SAFETENSORS_H

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "dtype.h"
#include "tensor.h"

//! \brief One named tensor inside a `.safetensors` file. Data is read lazily.
class SafeTensorEntry {
public:
    SafeTensorEntry(const std::string& name, const std::vector<long>& shape, ETensorDType dtype,
                    std::string file_name, std::ptrdiff_t data_begin, std::ptrdiff_t data_end);

    [[nodiscard]] const std::string& name() const { return mName; }
    [[nodiscard]] const std::vector<long>& shape() const { return mShape; }
    [[nodiscard]] ETensorDType dtype() const { return mDType; }

    //! Reads the full entry into `target`, validating rank and shape.
    //! With `allow_cast`, floating point entries are converted to the target dtype.
    void read_tensor(Tensor& target, bool allow_cast) const;

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
    //! Parses the header of a single `.safetensors` file.
    explicit SafeTensorsReader(const std::string& file_name);

    void load_tensors(ITensorContainer& container, bool allow_cast) const;

    [[nodiscard]] const std::vector<SafeTensorEntry>& entries() const { return mEntries; }
    [[nodiscard]] const SafeTensorEntry& find_entry(std::string_view name) const;
    [[nodiscard]] bool has_entry(std::string_view name) const;

private:
    void parse_single_file(const std::string& file_path);

    std::vector<SafeTensorEntry> mEntries;
};

//! \brief Collects host tensors and writes them as one `.safetensors` file. Data goes to
//! `<file>.tmp`, which commit() renames to the final name.
class SafeTensorWriter {
public:
    explicit SafeTensorWriter(std::string file_name);
    ~SafeTensorWriter();
    SafeTensorWriter(const SafeTensorWriter&) = delete;
    SafeTensorWriter& operator=(const SafeTensorWriter&) = delete;

    //! The tensor's memory must stay valid until commit().
    void add(const std::string& name, const Tensor& tensor);
    void commit();

private:
    std::string mFileName;
    std::map<std::string, Tensor> mTensors;
    bool mCommitted = false;
};

void load_safetensors(const std::string& file_name, ITensorContainer& tensors, bool allow_cast);
void write_safetensors(const std::string& file_name, ITensorContainer& tensors);

#endif //LOGSENTINEL_SRC_UTILITIES_SAFETENSORS_H
