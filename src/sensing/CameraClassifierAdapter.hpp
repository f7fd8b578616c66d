// sensing/CameraClassifierAdapter.hpp
#pragma once
#include <functional>
#include <QString>
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include "sensing/ClassifierAdapter.hpp"
#include "config/GuardConfig.hpp"

// 프레임 -> 라벨 (얼굴 인코딩/비교는 외부 함수)
using FrameClassifier = std::function<TrustLabel(const cv::Mat& bgr)>;

// 카메라 핸들을 독점 소유하고 주기마다 한 프레임을 분류기에 넘긴다.
// 연속 읽기 실패가 reopenAfterFails 에 닿으면 장치를 다시 연다.
class CameraClassifierAdapter : public ClassifierAdapter {
public:
	CameraClassifierAdapter(const CameraConfig& cfg, FrameClassifier classifier);
	~CameraClassifierAdapter() override;

	bool open() override;
	bool classify(TrustLabel& out) override;
	void close() override;
	bool isOpen() const override { return cap_.isOpened(); }
	QString name() const override;

	int readFailures() const { return failCount_; }

private:
	bool openCamera();
	bool readOne(cv::Mat& out);

	CameraConfig cfg_;
	FrameClassifier classifier_;
	cv::VideoCapture cap_;
	int failCount_ = 0;
};
