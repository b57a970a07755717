// model/standardize_cl.cpp
#include "model/scaler.h"
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>
#include "common/log.h"

#ifdef TF_WITH_OPENCL
// ---- OpenCL minimal host (optional) ----
#ifdef __APPLE__
#include <OpenCL/opencl.h>
#else
#include <CL/cl.h>
#endif

struct BatchStandardizer::ClCtx
{
  cl_platform_id platform{};
  cl_device_id device{};
  cl_context ctx{};
  cl_command_queue q{};
  cl_program prog{};
  cl_kernel kern{};
  cl_mem dX{}, dM{}, dS{};
  size_t X_cap = 0; // current buffer capacity in doubles
  size_t F_cap = 0; // feature width capacity
};

// Doubles keep the GPU path bit-compatible with FeatureScaler::transform.
static const char *KERNEL_SRC = R"CLC(
#pragma OPENCL EXTENSION cl_khr_fp64 : enable
__kernel void standardize(__global double* X,
                          __global const double* mean,
                          __global const double* scale,
                          int F) {
  int i = get_global_id(0);
  for (int j=0;j<F;++j) X[i*F + j] = (X[i*F + j] - mean[j]) / scale[j];
}
)CLC";

// --- small helper: print OpenCL build log on failure ---
static void cl_print_build_log(cl_program prog, cl_device_id dev)
{
  size_t sz = 0;
  if (clGetProgramBuildInfo(prog, dev, CL_PROGRAM_BUILD_LOG, 0, nullptr, &sz) == CL_SUCCESS && sz > 1)
  {
    std::string log(sz, '\0');
    if (clGetProgramBuildInfo(prog, dev, CL_PROGRAM_BUILD_LOG, sz, log.data(), nullptr) == CL_SUCCESS)
      LOG_WARN("[OpenCL] build log:\n%s", log.c_str());
  }
}

#endif

BatchStandardizer::BatchStandardizer(const ScalerConfig &c) : cfg_(c) { init_opencl_if_possible(); }

#ifdef TF_WITH_OPENCL
void BatchStandardizer::release_ctx(ClCtx *c)
{
  if (!c)
    return;
  if (c->kern)
    clReleaseKernel(c->kern);
  if (c->prog)
    clReleaseProgram(c->prog);
  if (c->dX)
    clReleaseMemObject(c->dX);
  if (c->dM)
    clReleaseMemObject(c->dM);
  if (c->dS)
    clReleaseMemObject(c->dS);
  if (c->q)
    clReleaseCommandQueue(c->q);
  if (c->ctx)
    clReleaseContext(c->ctx);
  delete c;
}

BatchStandardizer::~BatchStandardizer()
{
  release_ctx(cl_);
  cl_ = nullptr;
  has_cl_ = false;
}

namespace
{
  // First GPU, on any platform, that can run the fp64 kernel.
  bool find_fp64_gpu(cl_platform_id &platform, cl_device_id &device)
  {
    cl_uint n_plat = 0;
    if (clGetPlatformIDs(0, nullptr, &n_plat) != CL_SUCCESS || n_plat == 0)
      return false;
    std::vector<cl_platform_id> platforms(n_plat);
    if (clGetPlatformIDs(n_plat, platforms.data(), nullptr) != CL_SUCCESS)
      return false;

    for (cl_platform_id p : platforms)
    {
      cl_uint n_dev = 0;
      if (clGetDeviceIDs(p, CL_DEVICE_TYPE_GPU, 0, nullptr, &n_dev) != CL_SUCCESS || n_dev == 0)
        continue;
      std::vector<cl_device_id> gpus(n_dev);
      if (clGetDeviceIDs(p, CL_DEVICE_TYPE_GPU, n_dev, gpus.data(), nullptr) != CL_SUCCESS)
        continue;
      for (cl_device_id d : gpus)
      {
        cl_device_fp_config fp64 = 0;
        if (clGetDeviceInfo(d, CL_DEVICE_DOUBLE_FP_CONFIG, sizeof(fp64), &fp64, nullptr) == CL_SUCCESS && fp64 != 0)
        {
          platform = p;
          device = d;
          return true;
        }
      }
    }
    return false;
  }
} // namespace

void BatchStandardizer::init_opencl_if_possible()
{
  if (!cfg_.prefer_opencl)
    return;

  cl_platform_id platform{};
  cl_device_id device{};
  if (!find_fp64_gpu(platform, device))
  {
    LOG_INFO("standardizer: no fp64-capable OpenCL GPU, using CPU");
    return;
  }

  auto *c = new ClCtx();
  c->platform = platform;
  c->device = device;
  auto fail = [c](const char *stage)
  {
    LOG_WARN("standardizer: OpenCL %s failed, using CPU", stage);
    release_ctx(c);
  };

  cl_int err = CL_SUCCESS;
  c->ctx = clCreateContext(nullptr, 1, &c->device, nullptr, nullptr, &err);
  if (!c->ctx || err != CL_SUCCESS)
    return fail("context creation");

#if defined(CL_VERSION_2_0)
  c->q = clCreateCommandQueueWithProperties(c->ctx, c->device, nullptr, &err);
#else
  c->q = clCreateCommandQueue(c->ctx, c->device, 0, &err);
#endif
  if (!c->q || err != CL_SUCCESS)
    return fail("queue creation");

  const char *src = KERNEL_SRC;
  const size_t src_len = std::strlen(KERNEL_SRC);
  c->prog = clCreateProgramWithSource(c->ctx, 1, &src, &src_len, &err);
  if (!c->prog || err != CL_SUCCESS)
    return fail("program creation");
  if (clBuildProgram(c->prog, 1, &c->device, "", nullptr, nullptr) != CL_SUCCESS)
  {
    cl_print_build_log(c->prog, c->device);
    return fail("kernel build");
  }
  c->kern = clCreateKernel(c->prog, "standardize", &err);
  if (!c->kern || err != CL_SUCCESS)
    return fail("kernel lookup");

  cl_ = c;
  has_cl_ = true;
  LOG_INFO("standardizer: OpenCL GPU path enabled");
}

bool BatchStandardizer::gpu_apply(const FeatureScaler &scaler, FeatureMatrix &X)
{
  const size_t F = X.cols;
  const size_t N = X.rows * F;
  cl_int err = CL_SUCCESS;

  // (Re)allocate buffers if capacity is insufficient
  if (cl_->X_cap < N || cl_->F_cap < F)
  {
    if (cl_->dX)
      clReleaseMemObject(cl_->dX);
    if (cl_->dM)
      clReleaseMemObject(cl_->dM);
    if (cl_->dS)
      clReleaseMemObject(cl_->dS);
    cl_->dX = cl_->dM = cl_->dS = nullptr;
    cl_->X_cap = cl_->F_cap = 0;

    cl_->dX = clCreateBuffer(cl_->ctx, CL_MEM_READ_WRITE, sizeof(double) * N, nullptr, &err);
    if (!cl_->dX || err != CL_SUCCESS)
      return false;
    cl_->dM = clCreateBuffer(cl_->ctx, CL_MEM_READ_ONLY, sizeof(double) * F, nullptr, &err);
    if (!cl_->dM || err != CL_SUCCESS)
      return false;
    cl_->dS = clCreateBuffer(cl_->ctx, CL_MEM_READ_ONLY, sizeof(double) * F, nullptr, &err);
    if (!cl_->dS || err != CL_SUCCESS)
      return false;
    cl_->X_cap = N;
    cl_->F_cap = F;
  }

  if (clEnqueueWriteBuffer(cl_->q, cl_->dX, CL_TRUE, 0, sizeof(double) * N, X.data.data(), 0, nullptr, nullptr) != CL_SUCCESS)
    return false;
  if (clEnqueueWriteBuffer(cl_->q, cl_->dM, CL_TRUE, 0, sizeof(double) * F, scaler.mean().data(), 0, nullptr, nullptr) != CL_SUCCESS)
    return false;
  if (clEnqueueWriteBuffer(cl_->q, cl_->dS, CL_TRUE, 0, sizeof(double) * F, scaler.scale().data(), 0, nullptr, nullptr) != CL_SUCCESS)
    return false;

  const cl_int Fi = static_cast<cl_int>(F);
  if (clSetKernelArg(cl_->kern, 0, sizeof(cl_mem), &cl_->dX) != CL_SUCCESS ||
      clSetKernelArg(cl_->kern, 1, sizeof(cl_mem), &cl_->dM) != CL_SUCCESS ||
      clSetKernelArg(cl_->kern, 2, sizeof(cl_mem), &cl_->dS) != CL_SUCCESS ||
      clSetKernelArg(cl_->kern, 3, sizeof(cl_int), &Fi) != CL_SUCCESS)
    return false;

  size_t g = X.rows;
  if (clEnqueueNDRangeKernel(cl_->q, cl_->kern, 1, nullptr, &g, nullptr, 0, nullptr, nullptr) != CL_SUCCESS)
    return false;
  if (clFinish(cl_->q) != CL_SUCCESS)
    return false;

  // Download in place; on failure X still holds the raw values
  std::vector<double> out(N);
  if (clEnqueueReadBuffer(cl_->q, cl_->dX, CL_TRUE, 0, sizeof(double) * N, out.data(), 0, nullptr, nullptr) != CL_SUCCESS)
    return false;
  X.data.swap(out);
  return true;
}
#else
BatchStandardizer::~BatchStandardizer() = default;

void BatchStandardizer::init_opencl_if_possible()
{
  if (cfg_.prefer_opencl)
    LOG_INFO("standardizer: built without OpenCL, using CPU");
}

bool BatchStandardizer::gpu_apply(const FeatureScaler &, FeatureMatrix &)
{
  return false;
}
#endif

void BatchStandardizer::apply(const FeatureScaler &scaler, FeatureMatrix &X)
{
  if (!scaler.fitted())
    throw ModelNotLoadedError("feature scaler is not fitted");
  if (X.rows > 0 && X.cols != scaler.width())
    throw FeatureShapeError(scaler.width(), X.cols);

  if (has_cl_ && X.rows >= cfg_.min_rows_for_gpu && gpu_apply(scaler, X))
    return;
  scaler.transform_inplace(X);
}
