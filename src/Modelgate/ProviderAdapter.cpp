// =================================================================
// src/Modelgate/ProviderAdapter.cpp
// =================================================================
// Implementation of the adapter cache.

#include "Modelgate/ProviderAdapter.hpp"
#include "Modelgate/OpenAICompatibleAdapter.hpp"
#include "Modelgate/AnthropicAdapter.hpp"
#include "Modelgate/GenericRestAdapter.hpp"
#include "Modelgate/CustomAdapter.hpp"
#include "Modelgate/Logger.hpp"

namespace Modelgate {

AdapterCache::AdapterCache(std::chrono::milliseconds request_timeout)
    : m_request_timeout(request_timeout) {

    auto timeout = m_request_timeout;
    m_factories[ProviderKind::OPENAI_COMPATIBLE] = [timeout](const Endpoint&) {
        return std::make_shared<OpenAICompatibleAdapter>(timeout);
    };
    m_factories[ProviderKind::ANTHROPIC_STYLE] = [timeout](const Endpoint&) {
        return std::make_shared<AnthropicAdapter>(timeout);
    };
    m_factories[ProviderKind::GENERIC_REST] = [timeout](const Endpoint&) {
        return std::make_shared<GenericRestAdapter>(timeout);
    };
    m_factories[ProviderKind::CUSTOM] = [timeout](const Endpoint&) {
        return std::make_shared<CustomAdapter>(timeout);
    };
}

void AdapterCache::registerFactory(ProviderKind kind, AdapterFactory factory) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_factories[kind] = std::move(factory);

    for (auto it = m_adapters.begin(); it != m_adapters.end();) {
        if (it->second.kind == kind) {
            it = m_adapters.erase(it);
        } else {
            ++it;
        }
    }

    LOG_DEBUG("AdapterCache", "Registered factory for " + GatewayTypeUtils::providerKindToString(kind));
}

std::shared_ptr<ProviderAdapter> AdapterCache::getAdapter(const Endpoint& endpoint) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::string key = cacheKey(endpoint.provider_kind, endpoint.id);
    auto cached = m_adapters.find(key);
    if (cached != m_adapters.end()) {
        return cached->second.adapter;
    }

    auto factory_it = m_factories.find(endpoint.provider_kind);
    if (factory_it == m_factories.end() || !factory_it->second) {
        LOG_ERROR("AdapterCache", "No adapter factory for provider kind " +
                  GatewayTypeUtils::providerKindToString(endpoint.provider_kind));
        return nullptr;
    }

    auto adapter = factory_it->second(endpoint);
    if (adapter) {
        m_adapters[key] = CachedAdapter{endpoint.provider_kind, endpoint.id, adapter};
        LOG_DEBUG("AdapterCache", "Created " + adapter->getName() + " adapter for " + endpoint.id);
    }
    return adapter;
}

void AdapterCache::invalidate(const std::string& endpoint_id) {
    std::lock_guard<std::mutex> lock(m_mutex);

    for (auto it = m_adapters.begin(); it != m_adapters.end();) {
        if (it->second.endpoint_id == endpoint_id) {
            it = m_adapters.erase(it);
        } else {
            ++it;
        }
    }
}

void AdapterCache::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_adapters.clear();
}

size_t AdapterCache::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_adapters.size();
}

std::string AdapterCache::cacheKey(ProviderKind kind, const std::string& endpoint_id) {
    return GatewayTypeUtils::providerKindToString(kind) + "_" + endpoint_id;
}

} // namespace Modelgate
