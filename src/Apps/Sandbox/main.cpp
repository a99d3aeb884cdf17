#include <array>
#include <charconv>
#include <cstdint>
#include <cstring>
#include <memory>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include <entt/entity/registry.hpp>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

import Runtime;
import Graphics;
import Physics;
import RHI;
import Core;
import ECS;
import XR;

using namespace Core;
using namespace Runtime;

namespace
{
    struct SandboxOptions
    {
        uint32_t Frames = 600;
        bool ForceHeadless = false;
        bool EnableValidation = true;
    };

    SandboxOptions ParseOptions(int argc, char** argv)
    {
        SandboxOptions options;
        for (int i = 1; i < argc; ++i)
        {
            const std::string_view arg = argv[i];
            if (arg == "--headless")
            {
                options.ForceHeadless = true;
            }
            else if (arg == "--no-validation")
            {
                options.EnableValidation = false;
            }
            else if (arg == "--frames" && i + 1 < argc)
            {
                const char* value = argv[++i];
                uint32_t frames = 0;
                auto [ptr, ec] = std::from_chars(value, value + std::strlen(value), frames);
                if (ec == std::errc{} && frames > 0)
                    options.Frames = frames;
                else
                    Log::Warn("Ignoring invalid --frames value '{}'", value);
            }
            else
            {
                Log::Warn("Unknown argument '{}'", arg);
            }
        }
        return options;
    }

    // Unit cube, 24 vertices so every face gets its own normal.
    void BuildCube(std::vector<Graphics::Vertex>& vertices, std::vector<uint32_t>& indices)
    {
        const std::array<glm::vec3, 6> normals{
            glm::vec3(1, 0, 0), glm::vec3(-1, 0, 0), glm::vec3(0, 1, 0),
            glm::vec3(0, -1, 0), glm::vec3(0, 0, 1), glm::vec3(0, 0, -1)};

        for (const glm::vec3& n : normals)
        {
            const glm::vec3 u = glm::abs(n.y) > 0.5f ? glm::vec3(1, 0, 0) : glm::vec3(0, 1, 0);
            const glm::vec3 v = glm::cross(n, u);
            const auto base = static_cast<uint32_t>(vertices.size());

            const std::array<glm::vec2, 4> corners{glm::vec2(-1, -1), glm::vec2(1, -1), glm::vec2(1, 1), glm::vec2(-1, 1)};
            for (const glm::vec2& c : corners)
            {
                Graphics::Vertex vertex;
                vertex.Position = 0.5f * (n + c.x * u + c.y * v);
                vertex.Normal = n;
                vertex.TextureCoords = 0.5f * (c + glm::vec2(1.0f));
                vertices.push_back(vertex);
            }

            for (uint32_t index : {0u, 1u, 2u, 2u, 3u, 0u})
                indices.push_back(base + index);
        }
    }

    class SandboxApp : public Engine
    {
    public:
        SandboxApp(const EngineConfig& config, const EngineServices& services) : Engine(config, services) {}

        void OnStart() override
        {
            Log::Info("Sandbox Started!");

            std::vector<Graphics::Vertex> vertices;
            std::vector<uint32_t> indices;
            BuildCube(vertices, indices);

            auto& arena = GetArena();
            auto firstVertex = arena.AppendVertices(vertices);
            auto firstIndex = arena.AppendIndices(indices);
            Graphics::Material crate;
            crate.BaseColorFactor = glm::vec4(0.8f, 0.5f, 0.2f, 1.0f);
            crate.RoughnessFactor = 0.6f;
            auto material = arena.PushMaterial(crate);
            if (!firstVertex || !firstIndex || !material)
            {
                Log::Error("Failed to upload the crate mesh");
                return;
            }

            Graphics::MeshData mesh;
            mesh.MaterialId = *material;
            mesh.BoundingSphere = glm::vec4(0.0f, 0.0f, 0.0f, 0.87f);
            Graphics::Primitive primitive;
            primitive.IndexOffset = *firstIndex;
            primitive.IndexCount = static_cast<uint32_t>(indices.size());
            primitive.VertexOffset = static_cast<int32_t>(*firstVertex);
            primitive.BoundingSphere = mesh.BoundingSphere;
            mesh.Primitives.push_back(primitive);
            const Graphics::MeshHandle cube = arena.AllocateMesh(std::move(mesh));

            auto& physics = GetPhysics();
            Physics::BodyDesc floorDesc;
            floorDesc.Collider = Physics::BoxShape{glm::vec3(10.0f, 0.5f, 10.0f)};
            floorDesc.Position = glm::vec3(0.0f, -0.5f, 0.0f);
            floorDesc.Motion = Physics::MotionType::Static;
            if (auto floor = physics.CreateBody(floorDesc); !floor)
                Log::Warn("Failed to create the floor body: {}", ErrorCodeToString(floor.error()));

            auto& registry = m_Scene.GetRegistry();
            for (int i = 0; i < 3; ++i)
            {
                Physics::BodyDesc crateDesc;
                crateDesc.Position = glm::vec3(-1.5f + 1.5f * static_cast<float>(i), 2.0f + static_cast<float>(i), -2.0f);
                crateDesc.Rotation = glm::quat(glm::vec3(0.1f * static_cast<float>(i), 0.3f, 0.0f));
                auto body = physics.CreateBody(crateDesc);
                if (!body)
                {
                    Log::Warn("Failed to create crate body {}: {}", i, ErrorCodeToString(body.error()));
                    continue;
                }

                entt::entity entity = m_Scene.CreateEntity("Crate");
                registry.emplace<ECS::Components::RigidBody::Component>(entity, *body);
                registry.emplace<ECS::MeshRenderer::Component>(entity, cube);
                m_Crates.push_back(entity);
            }

            Graphics::PunctualLight sun;
            sun.Kind = Graphics::PunctualLight::Type::Directional;
            sun.Intensity = 3.0f;
            Graphics::NodePose sunPose;
            sunPose.Rotation = glm::quat(glm::vec3(-0.9f, 0.4f, 0.0f));
            SetLights({Graphics::LightFromPunctual(sun, sunPose)});
        }

        void OnUpdate(float deltaTime) override
        {
            (void)deltaTime;
            // Buzz the right controller while any crate is still in the air.
            const auto& registry = m_Scene.GetRegistry();
            for (entt::entity entity : m_Crates)
            {
                const auto& transform = registry.get<ECS::Components::Transform::Component>(entity);
                if (transform.Position.y > 0.6f)
                {
                    GetHaptics().RequestFeedback(0.25f, XR::Handedness::Right);
                    break;
                }
            }
        }

    private:
        std::vector<entt::entity> m_Crates;
    };

    // Device objects for the Vulkan path, destroyed bottom to top.
    struct DeviceStack
    {
        std::unique_ptr<RHI::VulkanContext> Context;
        std::unique_ptr<RHI::VulkanDevice> Device;
        std::unique_ptr<Graphics::VulkanArenaBackend> Backend;
        std::unique_ptr<Graphics::VulkanFrameRenderer> Renderer;
    };

    bool CreateDeviceStack(DeviceStack& stack, const EngineConfig& config, bool enableValidation)
    {
        RHI::ContextConfig contextConfig;
        contextConfig.AppName = config.AppName;
        contextConfig.EnableValidation = enableValidation;
        contextConfig.Headless = true;
        stack.Context = std::make_unique<RHI::VulkanContext>(contextConfig);
        if (!stack.Context->IsValid()) return false;

        RHI::DeviceConfig deviceConfig;
        deviceConfig.FramesInFlight = config.FramesInFlight;
        deviceConfig.MaxBoundTextures = config.Arena.MaxTextures;
        stack.Device = std::make_unique<RHI::VulkanDevice>(*stack.Context, deviceConfig);
        if (!stack.Device->IsValid()) return false;

        stack.Backend = std::make_unique<Graphics::VulkanArenaBackend>(*stack.Device, config.Arena);
        if (!stack.Backend->IsValid()) return false;

        stack.Renderer = std::make_unique<Graphics::VulkanFrameRenderer>(*stack.Device, *stack.Backend);
        return stack.Renderer->IsValid();
    }
}

int main(int argc, char** argv)
{
    const SandboxOptions options = ParseOptions(argc, argv);

    QuitSignal quit;
    quit.InstallInterruptHandler();

    EngineConfig config;
    config.AppName = "Sandbox";
    config.Arena.FramesInFlight = config.FramesInFlight;

    DeviceStack device;
    std::unique_ptr<Graphics::HostArenaBackend> hostBackend;
    std::unique_ptr<Graphics::HeadlessFrameRenderer> headlessRenderer;
    Graphics::IArenaBackend* backend = nullptr;
    Graphics::IFrameRenderer* renderer = nullptr;

    if (!options.ForceHeadless && CreateDeviceStack(device, config, options.EnableValidation))
    {
        backend = device.Backend.get();
        renderer = device.Renderer.get();
        Log::Info("Rendering on the Vulkan device");
    }
    else
    {
        if (!options.ForceHeadless) Log::Warn("No usable Vulkan device, falling back to host memory");
        device.Renderer.reset();
        device.Backend.reset();
        device.Device.reset();
        device.Context.reset();
        hostBackend = std::make_unique<Graphics::HostArenaBackend>(config.Arena);
        headlessRenderer = std::make_unique<Graphics::HeadlessFrameRenderer>();
        backend = hostBackend.get();
        renderer = headlessRenderer.get();
    }

    XR::SimulatedRuntime runtime;
    runtime.RequestExitAfterFrames(options.Frames);
    XR::NullPlatformEventSource platform;

    int exitCode = 0;
    {
        SandboxApp app(config, EngineServices{runtime, platform, *backend, *renderer, quit});
        if (auto result = app.Run(); !result)
        {
            Log::Error("Sandbox stopped: {}", ErrorCodeToString(result.error()));
            exitCode = 1;
        }
    }

    quit.RemoveInterruptHandler();
    return exitCode;
}
