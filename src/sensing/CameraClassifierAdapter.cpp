// sensing/CameraClassifierAdapter.cpp
#include "sensing/CameraClassifierAdapter.hpp"
#include "log/guard_logging.hpp"

CameraClassifierAdapter::CameraClassifierAdapter(const CameraConfig& cfg, FrameClassifier classifier)
	: cfg_(cfg), classifier_(std::move(classifier))
{
}

CameraClassifierAdapter::~CameraClassifierAdapter()
{
	close();
}

QString CameraClassifierAdapter::name() const
{
	if (!cfg_.pipeline.isEmpty()) return QStringLiteral("camera[gst]");
	if (!cfg_.device.isEmpty())	  return QString("camera[%1]").arg(cfg_.device);
	return QString("camera[index]%1").arg(cfg_.index);
}

bool CameraClassifierAdapter::open()
{
	failCount_ = 0;
	return openCamera();
}

bool CameraClassifierAdapter::openCamera()
{
	close();

	bool ok = false;
	if (!cfg_.pipeline.isEmpty()) {
		ok = cap_.open(cfg_.pipeline.toStdString(), cv::CAP_GSTREAMER);
	} else if (!cfg_.device.isEmpty()) {
		ok = cap_.open(cfg_.device.toStdString(), cv::CAP_V4L2);
	} else {
		ok = cap_.open(cfg_.index, cv::CAP_V4L2);
	}

	if (!ok || !cap_.isOpened()) {
		qCWarning(LC_SENSING) << "[CameraClassifierAdapter] open failed:" << name();
		cap_.release();
		return false;
	}

	if (cfg_.width > 0)  cap_.set(cv::CAP_PROP_FRAME_WIDTH,  cfg_.width);
	if (cfg_.height > 0) cap_.set(cv::CAP_PROP_FRAME_HEIGHT, cfg_.height);

	qCInfo(LC_SENSING) << "[CameraClassifierAdapter] opened" << name()
		<< " -> " << int(cap_.get(cv::CAP_PROP_FRAME_WIDTH)) << "x" << int(cap_.get(cv::CAP_PROP_FRAME_HEIGHT));
	return true;
}

void CameraClassifierAdapter::close()
{
	if (cap_.isOpened()) {
		cap_.release();
		qCInfo(LC_SENSING) << "[CameraClassifierAdapter] released" << name();
	}
}

bool CameraClassifierAdapter::readOne(cv::Mat& out)
{
	return cap_.read(out) && !out.empty();
}

bool CameraClassifierAdapter::classify(TrustLabel& out)
{
	if (!cap_.isOpened() && !openCamera()) {
		return false;
	}

	cv::Mat bgr;
	if (!readOne(bgr)) {
		if (++failCount_ >= cfg_.reopenAfterFails) {
			qCWarning(LC_SENSING) << "[CameraClassifierAdapter] read fail threshold, reopening...";
			failCount_ = 0;
			if (!openCamera()) {
				qCWarning(LC_SENSING) << "[CameraClassifierAdapter] reopen failed, retry next cycle";
			}
		}
		return false;
	}
	failCount_ = 0;

	if (!classifier_) {
		out = TrustLabel::NoSignal;
		return true;
	}

	out = classifier_(bgr);
	return true;
}
