//----------------------------------------------------------------------------------------------------------------------
// File: ServiceProvider.hpp
// Description: A type indexed registry of the services shared with the route handlers. Handlers only hold weak 
// references, the host owns every registered service.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <any>
#include <memory>
#include <typeindex>
#include <unordered_map>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Host {
//----------------------------------------------------------------------------------------------------------------------

class ServiceProvider;

//----------------------------------------------------------------------------------------------------------------------
} // Host namespace
//----------------------------------------------------------------------------------------------------------------------

class Host::ServiceProvider final 
{
public:
    ServiceProvider() = default;

    template<typename Service>
    bool Register(std::shared_ptr<Service> const& spService);

    template<typename Service>
    [[nodiscard]] bool Contains() const;

    template<typename Service>
    [[nodiscard]] std::weak_ptr<Service> Fetch() const;

private:
    std::unordered_map<std::type_index, std::any> m_services;
};

//----------------------------------------------------------------------------------------------------------------------

template<typename Service>
bool Host::ServiceProvider::Register(std::shared_ptr<Service> const& spService)
{
    if (!spService) { return false; }
    m_services.insert_or_assign(typeid(Service), std::weak_ptr<Service>{ spService });
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

template<typename Service>
bool Host::ServiceProvider::Contains() const { return m_services.contains(typeid(Service)); }

//----------------------------------------------------------------------------------------------------------------------

template<typename Service>
std::weak_ptr<Service> Host::ServiceProvider::Fetch() const
{
    if (auto const itr = m_services.find(typeid(Service)); itr != m_services.end()) {
        auto const& [key, store] = *itr;
        return std::any_cast<std::weak_ptr<Service>>(store);
    }

    return std::weak_ptr<Service>{};
}

//----------------------------------------------------------------------------------------------------------------------
