#include <gtest/gtest.h>
#include <string>
#include <utility>
#include <vector>

#include "Camera.hpp"
#include "FrameSession.hpp"
#include "PerspectiveCamera.hpp"
#include "Renderable.hpp"
#include "Renderer.hpp"
#include "Scene.hpp"
#include "TestSupport.hpp"

namespace
{
    /// Records its calls into a shared log; owns no GPU resources.
    class RecordingRenderable : public Renderable
    {
    public:
        RecordingRenderable(std::string name, std::vector<std::string>& log, bool failInit = false) :
            Renderable(std::move(name)), m_log(log), m_failInit(failInit)
        {
        }

        ~RecordingRenderable() noexcept override
        {
            dispose();
        }

        int disposed = 0;

    protected:
        bool createResources(const VulkanContext&, VkRenderPass, VkSampleCountFlagBits) override
        {
            m_log.push_back("init:" + name());
            return !m_failInit;
        }

        void record(VkCommandBuffer, const Camera&) override
        {
            m_log.push_back("draw:" + name());
        }

        void releaseResources() noexcept override
        {
            ++disposed;
        }

    private:
        std::vector<std::string>& m_log;
        bool                      m_failInit = false;
    };

    /// Skips the render pass step, so it initializes against unreachableContext().
    class DetachedRenderable final : public RecordingRenderable
    {
    public:
        using RecordingRenderable::RecordingRenderable;

        int forgotten = 0;

    protected:
        bool build(const VulkanContext& ctx, VkFormat, VkSampleCountFlagBits samples) override
        {
            return createResources(ctx, VK_NULL_HANDLE, samples);
        }

        void forgetResources() noexcept override
        {
            ++forgotten;
        }
    };

    /// Counts binding builds instead of allocating a uniform buffer.
    class DetachedCamera final : public Camera
    {
    public:
        int bindings = 0;

    protected:
        void updateProjection() override
        {
            m_projection = glm::mat4(1.0f);
        }

        bool createBinding(const VulkanContext&) override
        {
            ++bindings;
            return true;
        }
    };

    FrameSession frameOn(uint64_t generation)
    {
        FrameSession s = {};
        s.generation   = generation;
        return s;
    }
} // namespace

TEST(Scene, AddIgnoresNullAndDuplicates)
{
    std::vector<std::string> log;
    RecordingRenderable      a("a", log);
    RecordingRenderable      b("b", log);

    Scene scene;
    scene.addRenderable(&a);
    scene.addRenderable(nullptr);
    scene.addRenderable(&b);
    scene.addRenderable(&a);

    ASSERT_EQ(scene.renderables().size(), 2u);
    EXPECT_EQ(scene.renderables()[0], &a);
    EXPECT_EQ(scene.renderables()[1], &b);
}

TEST(Scene, RemoveDoesNotDispose)
{
    std::vector<std::string> log;
    RecordingRenderable      a("a", log);
    RecordingRenderable      b("b", log);

    Scene scene;
    scene.addRenderable(&a);
    scene.addRenderable(&b);
    scene.removeRenderable(&a);

    ASSERT_EQ(scene.renderables().size(), 1u);
    EXPECT_EQ(scene.renderables()[0], &b);
    EXPECT_EQ(a.disposed, 0);

    scene.clearRenderables();
    EXPECT_TRUE(scene.renderables().empty());
}

TEST(Scene, PrepareNeedsInitializedRenderer)
{
    DiagCapture       diag;
    Renderer          renderer;
    PerspectiveCamera camera;
    Scene             scene;

    EXPECT_EQ(scene.prepare(renderer, camera), RenderStatus::UsageError);
    EXPECT_FALSE(scene.isPrepared());
    EXPECT_EQ(scene.camera(), nullptr);
    EXPECT_EQ(diag.count(DiagCode::SceneRendererNotInitialized), 1u);
}

TEST(Scene, RenderBeforePrepareIsUsageError)
{
    DiagCapture              diag;
    std::vector<std::string> log;
    RecordingRenderable      a("a", log);

    Scene scene;
    scene.addRenderable(&a);

    EXPECT_EQ(scene.render(FrameSession{}), RenderStatus::UsageError);
    EXPECT_TRUE(log.empty());
    EXPECT_EQ(diag.count(DiagCode::SceneNotPrepared), 1u);
}

TEST(Scene, PreparesAndDrawsInInsertionOrder)
{
    auto device = acquireHeadlessDevice();
    if (!device)
        GTEST_SKIP() << "No Vulkan device available";

    DiagCapture              diag;
    std::vector<std::string> log;
    PerspectiveCamera        camera;
    RecordingRenderable      first("first", log);
    RecordingRenderable      second("second", log);

    Scene scene;
    scene.addRenderable(&first);
    scene.addRenderable(&second);

    ASSERT_EQ(scene.prepare(device->context(), VK_FORMAT_B8G8R8A8_UNORM, VK_SAMPLE_COUNT_1_BIT, camera), RenderStatus::Ok);
    EXPECT_TRUE(scene.isPrepared());
    EXPECT_EQ(scene.camera(), &camera);
    EXPECT_TRUE(first.isInitialized());
    EXPECT_TRUE(second.isInitialized());
    EXPECT_TRUE(camera.hasBinding());
    EXPECT_EQ(diag.count(DiagCode::ScenePrepared), 1u);

    ASSERT_EQ(log, (std::vector<std::string>{"init:first", "init:second"}));

    log.clear();
    EXPECT_EQ(scene.render(frameOn(device->context().generation)), RenderStatus::Ok);
    EXPECT_EQ(log, (std::vector<std::string>{"draw:first", "draw:second"}));

    // Adding invalidates the preparation.
    RecordingRenderable third("third", log);
    scene.addRenderable(&third);
    EXPECT_FALSE(scene.isPrepared());

    first.dispose();
    second.dispose();
    camera.releaseBinding();
}

TEST(Scene, FirstFailingRenderableStopsPreparation)
{
    auto device = acquireHeadlessDevice();
    if (!device)
        GTEST_SKIP() << "No Vulkan device available";

    DiagCapture              diag;
    std::vector<std::string> log;
    PerspectiveCamera        camera;
    RecordingRenderable      ok("ok", log);
    RecordingRenderable      broken("broken", log, true);
    RecordingRenderable      never("never", log);

    Scene scene;
    scene.addRenderable(&ok);
    scene.addRenderable(&broken);
    scene.addRenderable(&never);

    EXPECT_EQ(scene.prepare(device->context(), VK_FORMAT_B8G8R8A8_UNORM, VK_SAMPLE_COUNT_1_BIT, camera),
              RenderStatus::DeviceRequestError);
    EXPECT_FALSE(scene.isPrepared());
    EXPECT_FALSE(broken.isInitialized());
    EXPECT_FALSE(never.isInitialized());
    EXPECT_EQ(diag.count(DiagCode::SceneRenderableInitFailed), 1u);
    EXPECT_EQ(log, (std::vector<std::string>{"init:ok", "init:broken"}));

    ok.dispose();
}

TEST(Scene, RefusesFramesFromAnotherDeviceGeneration)
{
    DiagCapture              diag;
    std::vector<std::string> log;
    DetachedCamera           camera;
    DetachedRenderable       first("first", log);
    DetachedRenderable       second("second", log);

    Scene scene;
    scene.addRenderable(&first);
    scene.addRenderable(&second);

    ASSERT_EQ(scene.prepare(unreachableContext(1), VK_FORMAT_B8G8R8A8_UNORM, VK_SAMPLE_COUNT_1_BIT, camera),
              RenderStatus::Ok);
    EXPECT_EQ(scene.generation(), 1u);

    log.clear();
    EXPECT_EQ(scene.render(frameOn(1)), RenderStatus::Ok);
    EXPECT_EQ(log, (std::vector<std::string>{"draw:first", "draw:second"}));

    log.clear();
    EXPECT_EQ(scene.render(frameOn(2)), RenderStatus::UsageError);
    EXPECT_TRUE(log.empty());
    EXPECT_EQ(diag.count(DiagCode::SceneStaleDevice), 1u);
    EXPECT_FALSE(scene.isPrepared());

    // Frames from the generation it was prepared on are refused too until prepare() runs again.
    EXPECT_EQ(scene.render(frameOn(1)), RenderStatus::UsageError);
    EXPECT_EQ(diag.count(DiagCode::SceneNotPrepared), 1u);
}

TEST(Scene, PrepareOnNewGenerationDropsOldHandlesWithoutReleasing)
{
    DiagCapture              diag;
    std::vector<std::string> log;
    DetachedCamera           camera;
    DetachedRenderable       a("a", log);

    Scene scene;
    scene.addRenderable(&a);

    ASSERT_EQ(scene.prepare(unreachableContext(1), VK_FORMAT_B8G8R8A8_UNORM, VK_SAMPLE_COUNT_1_BIT, camera),
              RenderStatus::Ok);
    EXPECT_EQ(a.generation(), 1u);
    EXPECT_EQ(camera.bindingGeneration(), 1u);
    EXPECT_EQ(camera.bindings, 1);

    // Same device: the old resources are released normally.
    ASSERT_EQ(scene.prepare(unreachableContext(1), VK_FORMAT_B8G8R8A8_UNORM, VK_SAMPLE_COUNT_1_BIT, camera),
              RenderStatus::Ok);
    EXPECT_EQ(a.disposed, 1);
    EXPECT_EQ(a.forgotten, 0);
    EXPECT_EQ(camera.bindings, 1);

    // New device: the old device is gone, nothing may be released on it.
    ASSERT_EQ(scene.prepare(unreachableContext(2), VK_FORMAT_B8G8R8A8_UNORM, VK_SAMPLE_COUNT_1_BIT, camera),
              RenderStatus::Ok);
    EXPECT_EQ(a.disposed, 1);
    EXPECT_EQ(a.forgotten, 1);
    EXPECT_EQ(a.generation(), 2u);
    EXPECT_EQ(camera.bindings, 2);
    EXPECT_EQ(camera.bindingGeneration(), 2u);
    EXPECT_EQ(scene.generation(), 2u);

    log.clear();
    EXPECT_EQ(scene.render(frameOn(2)), RenderStatus::Ok);
    EXPECT_EQ(log, (std::vector<std::string>{"draw:a"}));
    EXPECT_EQ(diag.count(DiagSeverity::Error), 0u);
}

TEST(Scene, ReleaseGpuResourcesDisposesRenderablesAndCamera)
{
    DiagCapture              diag;
    std::vector<std::string> log;
    DetachedCamera           camera;
    DetachedRenderable       a("a", log);
    DetachedRenderable       b("b", log);

    Scene scene;
    scene.addRenderable(&a);
    scene.addRenderable(&b);

    ASSERT_EQ(scene.prepare(unreachableContext(3), VK_FORMAT_B8G8R8A8_UNORM, VK_SAMPLE_COUNT_1_BIT, camera),
              RenderStatus::Ok);

    scene.releaseGpuResources();

    EXPECT_EQ(a.disposed, 1);
    EXPECT_EQ(b.disposed, 1);
    EXPECT_FALSE(a.isInitialized());
    EXPECT_EQ(camera.bindingGeneration(), 0u);
    EXPECT_FALSE(scene.isPrepared());
    EXPECT_EQ(scene.generation(), 0u);

    EXPECT_EQ(scene.render(frameOn(3)), RenderStatus::UsageError);
    EXPECT_EQ(diag.count(DiagCode::SceneNotPrepared), 1u);

    // Idempotent.
    scene.releaseGpuResources();
    EXPECT_EQ(a.disposed, 1);
}

TEST(Scene, PreparesAgainOnReplacementDevice)
{
    auto device = acquireHeadlessDevice();
    if (!device)
        GTEST_SKIP() << "No Vulkan device available";

    std::vector<std::string> log;
    PerspectiveCamera        camera;
    RecordingRenderable      a("a", log);

    Scene scene;
    scene.addRenderable(&a);

    ASSERT_EQ(scene.prepare(device->context(), VK_FORMAT_B8G8R8A8_UNORM, VK_SAMPLE_COUNT_1_BIT, camera), RenderStatus::Ok);
    const uint64_t firstGeneration = device->context().generation;

    // What Renderer::shutdown() does through its release listeners.
    scene.releaseGpuResources();
    device->destroy();
    device.reset();

    auto replacement = acquireHeadlessDevice();
    ASSERT_NE(replacement, nullptr);
    ASSERT_NE(replacement->context().generation, firstGeneration);

    DiagCapture diag;
    ASSERT_EQ(scene.prepare(replacement->context(), VK_FORMAT_B8G8R8A8_UNORM, VK_SAMPLE_COUNT_1_BIT, camera),
              RenderStatus::Ok);
    EXPECT_EQ(scene.generation(), replacement->context().generation);
    EXPECT_EQ(camera.bindingGeneration(), replacement->context().generation);
    EXPECT_TRUE(camera.hasBinding());
    EXPECT_EQ(diag.count(DiagSeverity::Error), 0u);

    scene.releaseGpuResources();
}
