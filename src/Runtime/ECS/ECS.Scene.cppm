module;
#include <string>
#include <entt/entity/registry.hpp>

export module ECS:Scene;

export namespace ECS
{
    class Scene
    {
    public:
        Scene() = default;
        ~Scene() = default;

        Scene(const Scene&) = delete;
        Scene& operator=(const Scene&) = delete;

        // New entities carry a name, an identity transform and a dirty tag so the
        // first transform pass produces their world matrix.
        entt::entity CreateEntity(const std::string& name);

        entt::registry& GetRegistry() { return m_Registry; }
        [[nodiscard]] const entt::registry& GetRegistry() const { return m_Registry; }

        [[nodiscard]] size_t Size() const { return m_Registry.storage<entt::entity>()->size(); }

    private:
        entt::registry m_Registry;
    };
}
