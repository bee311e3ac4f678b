/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include "rapidjson/document.h"

namespace vstore {
namespace persist {

// One alternative per embedding provider. The core never calls a provider;
// it only records which one produced a collection's vectors.

struct AlibabaEmbedding {
    std::string model_name = "text-embedding-v4";
    uint32_t dimension = 1024;
    std::string api_key_env;   // name of the env var holding the key, never the key

    bool operator==(const AlibabaEmbedding& o) const {
        return model_name == o.model_name && dimension == o.dimension && api_key_env == o.api_key_env;
    }
};

struct OllamaEmbedding {
    std::string model_name = "mxbai-embed-large";
    std::string base_url = "http://localhost:11434";
    uint32_t timeout_seconds = 60;
    std::optional<uint32_t> dimension;

    bool operator==(const OllamaEmbedding& o) const {
        return model_name == o.model_name && base_url == o.base_url &&
               timeout_seconds == o.timeout_seconds && dimension == o.dimension;
    }
};

struct SentenceTransformerEmbedding {
    std::string model_name = "all-MiniLM-L6-v2";
    std::optional<uint32_t> dimension = 384u;

    bool operator==(const SentenceTransformerEmbedding& o) const {
        return model_name == o.model_name && dimension == o.dimension;
    }
};

// Collections rebuilt from orphaned directories: only the dimension is known
struct UnknownEmbedding {
    std::optional<uint32_t> dimension;

    bool operator==(const UnknownEmbedding& o) const { return dimension == o.dimension; }
};

using EmbeddingDescriptor = std::variant<AlibabaEmbedding,
                                         OllamaEmbedding,
                                         SentenceTransformerEmbedding,
                                         UnknownEmbedding>;

const char* provider_name(const EmbeddingDescriptor& d);
std::string model_name(const EmbeddingDescriptor& d);
std::optional<uint32_t> dimension_of(const EmbeddingDescriptor& d);

// "1024" or "unknown"
std::string dimension_label(const EmbeddingDescriptor& d);

// Throws InvalidArgumentError naming the first bad field
void validate_embedding(const EmbeddingDescriptor& d);

// Parse and validate; throws InvalidArgumentError on unknown providers or bad fields
EmbeddingDescriptor embedding_from_json(const rapidjson::Value& v);

template <typename Writer>
void write_embedding_json(Writer& writer, const EmbeddingDescriptor& d) {
    auto write_dimension = [&writer](const std::optional<uint32_t>& dim) {
        writer.Key("dimension");
        if (dim) {
            writer.Uint(*dim);
        } else {
            writer.Null();
        }
    };

    writer.StartObject();
    writer.Key("provider");
    writer.String(provider_name(d));

    if (const auto* a = std::get_if<AlibabaEmbedding>(&d)) {
        writer.Key("model_name");
        writer.String(a->model_name.c_str());
        write_dimension(a->dimension);
        writer.Key("api_key_env");
        writer.String(a->api_key_env.c_str());
    } else if (const auto* o = std::get_if<OllamaEmbedding>(&d)) {
        writer.Key("model_name");
        writer.String(o->model_name.c_str());
        writer.Key("base_url");
        writer.String(o->base_url.c_str());
        writer.Key("timeout_seconds");
        writer.Uint(o->timeout_seconds);
        write_dimension(o->dimension);
    } else if (const auto* s = std::get_if<SentenceTransformerEmbedding>(&d)) {
        writer.Key("model_name");
        writer.String(s->model_name.c_str());
        write_dimension(s->dimension);
    } else if (const auto* u = std::get_if<UnknownEmbedding>(&d)) {
        write_dimension(u->dimension);
    }

    writer.EndObject();
}

} // namespace persist
} // namespace vstore
