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

#include "embedding_descriptor.h"
#include "config.h"
#include "errors.h"

namespace vstore {
namespace persist {

const char* provider_name(const EmbeddingDescriptor& d) {
    switch (d.index()) {
        case 0: return "alibaba";
        case 1: return "ollama";
        case 2: return "sentence_transformers";
        default: return "unknown";
    }
}

std::string model_name(const EmbeddingDescriptor& d) {
    if (const auto* a = std::get_if<AlibabaEmbedding>(&d)) return a->model_name;
    if (const auto* o = std::get_if<OllamaEmbedding>(&d)) return o->model_name;
    if (const auto* s = std::get_if<SentenceTransformerEmbedding>(&d)) return s->model_name;
    return "unknown";
}

std::optional<uint32_t> dimension_of(const EmbeddingDescriptor& d) {
    if (const auto* a = std::get_if<AlibabaEmbedding>(&d)) return a->dimension;
    if (const auto* o = std::get_if<OllamaEmbedding>(&d)) return o->dimension;
    if (const auto* s = std::get_if<SentenceTransformerEmbedding>(&d)) return s->dimension;
    return std::get<UnknownEmbedding>(d).dimension;
}

std::string dimension_label(const EmbeddingDescriptor& d) {
    auto dim = dimension_of(d);
    return dim ? std::to_string(*dim) : std::string("unknown");
}

static void check_dimension(const std::optional<uint32_t>& dim, const char* provider) {
    if (dim && (*dim == 0 || *dim > engine::kMaxDimension)) {
        throw InvalidArgumentError(std::string(provider) + ": dimension " +
                                   std::to_string(*dim) + " out of range");
    }
}

static void check_model(const std::string& model, const char* provider) {
    if (model.empty()) {
        throw InvalidArgumentError(std::string(provider) + ": model_name must not be empty");
    }
}

void validate_embedding(const EmbeddingDescriptor& d) {
    const char* provider = provider_name(d);
    if (const auto* a = std::get_if<AlibabaEmbedding>(&d)) {
        check_model(a->model_name, provider);
        check_dimension(a->dimension, provider);
    } else if (const auto* o = std::get_if<OllamaEmbedding>(&d)) {
        check_model(o->model_name, provider);
        check_dimension(o->dimension, provider);
        if (o->base_url.compare(0, 7, "http://") != 0 && o->base_url.compare(0, 8, "https://") != 0) {
            throw InvalidArgumentError("ollama: base_url must start with http:// or https://");
        }
        if (o->timeout_seconds == 0) {
            throw InvalidArgumentError("ollama: timeout_seconds must be positive");
        }
    } else if (const auto* s = std::get_if<SentenceTransformerEmbedding>(&d)) {
        check_model(s->model_name, provider);
        check_dimension(s->dimension, provider);
    } else {
        check_dimension(std::get<UnknownEmbedding>(d).dimension, provider);
    }
}

static std::optional<uint32_t> optional_dimension(const rapidjson::Value& v) {
    if (!v.HasMember("dimension") || v["dimension"].IsNull()) {
        return std::nullopt;
    }
    if (!v["dimension"].IsUint()) {
        throw InvalidArgumentError("embedding: dimension must be an unsigned integer or null");
    }
    return v["dimension"].GetUint();
}

static std::string required_string(const rapidjson::Value& v, const char* key, const char* provider) {
    if (!v.HasMember(key) || !v[key].IsString()) {
        throw InvalidArgumentError(std::string(provider) + ": missing string field '" + key + "'");
    }
    return v[key].GetString();
}

EmbeddingDescriptor embedding_from_json(const rapidjson::Value& v) {
    if (!v.IsObject() || !v.HasMember("provider") || !v["provider"].IsString()) {
        throw InvalidArgumentError("embedding: object with a string 'provider' expected");
    }
    std::string provider = v["provider"].GetString();

    EmbeddingDescriptor d = UnknownEmbedding{};
    if (provider == "alibaba") {
        AlibabaEmbedding a;
        a.model_name = required_string(v, "model_name", "alibaba");
        auto dim = optional_dimension(v);
        if (!dim) {
            throw InvalidArgumentError("alibaba: dimension is required");
        }
        a.dimension = *dim;
        if (v.HasMember("api_key_env") && v["api_key_env"].IsString()) {
            a.api_key_env = v["api_key_env"].GetString();
        }
        d = a;
    } else if (provider == "ollama") {
        OllamaEmbedding o;
        o.model_name = required_string(v, "model_name", "ollama");
        if (v.HasMember("base_url") && v["base_url"].IsString()) {
            o.base_url = v["base_url"].GetString();
        }
        if (v.HasMember("timeout_seconds") && v["timeout_seconds"].IsUint()) {
            o.timeout_seconds = v["timeout_seconds"].GetUint();
        }
        o.dimension = optional_dimension(v);
        d = o;
    } else if (provider == "sentence_transformers") {
        SentenceTransformerEmbedding s;
        s.model_name = required_string(v, "model_name", "sentence_transformers");
        s.dimension = optional_dimension(v);
        d = s;
    } else if (provider == "unknown") {
        d = UnknownEmbedding{optional_dimension(v)};
    } else {
        throw InvalidArgumentError("embedding: unsupported provider '" + provider + "'");
    }

    validate_embedding(d);
    return d;
}

} // namespace persist
} // namespace vstore
